/*
 * Copyright (C) 2025 The Cine developers
 *
 * This file is part of Cine.
 *
 * Cine is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Cine is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Cine.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "QueryFilters.hpp"

#include <algorithm>
#include <limits>

#include "core/ILogger.hpp"

namespace cine::recommendation
{
    namespace
    {
        void restrictMinYear(knowledge::QueryFilters& filters, int year)
        {
            filters.minYear = filters.minYear ? std::max(*filters.minYear, year) : year;
        }

        void restrictMaxYear(knowledge::QueryFilters& filters, int year)
        {
            filters.maxYear = filters.maxYear ? std::min(*filters.maxYear, year) : year;
        }

        // saturating, strict bounds at the int limits are kept inclusive
        int getPreviousYear(int year)
        {
            return year == std::numeric_limits<int>::min() ? year : year - 1;
        }

        int getNextYear(int year)
        {
            return year == std::numeric_limits<int>::max() ? year : year + 1;
        }

        void applyConstraint(knowledge::QueryFilters& filters, const session::YearConstraint& constraint, const knowledge::PropertyCatalog&)
        {
            switch (constraint.comparison)
            {
            case session::Comparison::Less:
                restrictMaxYear(filters, getPreviousYear(constraint.year));
                break;
            case session::Comparison::LessOrEqual:
                restrictMaxYear(filters, constraint.year);
                break;
            case session::Comparison::Equal:
                restrictMinYear(filters, constraint.year);
                restrictMaxYear(filters, constraint.year);
                break;
            case session::Comparison::GreaterOrEqual:
                restrictMinYear(filters, constraint.year);
                break;
            case session::Comparison::Greater:
                restrictMinYear(filters, getNextYear(constraint.year));
                break;
            }
        }

        void applyConstraint(knowledge::QueryFilters& filters, const session::YearRangeConstraint& constraint, const knowledge::PropertyCatalog&)
        {
            restrictMinYear(filters, std::min(constraint.start, constraint.end));
            restrictMaxYear(filters, std::max(constraint.start, constraint.end));
        }

        void applyConstraint(knowledge::QueryFilters& filters, const session::LanguageConstraint& constraint, const knowledge::PropertyCatalog& catalog)
        {
            const std::optional<knowledge::PropertyRef> languageProperty{ catalog.getProperty(knowledge::PropertyKind::Language) };
            if (!languageProperty)
            {
                CINE_LOG(RECOMMENDATION, WARNING, "No language property configured, ignoring language constraint");
                return;
            }

            filters.required.push_back(knowledge::PropertyValue{ *languageProperty, constraint.language });
        }

        void applyConstraint(knowledge::QueryFilters& filters, const session::MinRatingConstraint& constraint, const knowledge::PropertyCatalog&)
        {
            filters.minRating = constraint.threshold;
        }
    } // namespace

    knowledge::QueryFilters createQueryFilters(const session::Constraints& constraints, const session::Negations& negations, const knowledge::PropertyCatalog& catalog)
    {
        knowledge::QueryFilters filters;
        filters.requiredType = catalog.getRecommendableTypeFilter();

        for (const auto& [kind, constraint] : constraints)
            std::visit([&](const auto& c) { applyConstraint(filters, c, catalog); }, constraint);

        for (const auto& [kind, entity] : negations)
        {
            const std::optional<knowledge::PropertyRef> property{ catalog.getProperty(kind) };
            if (!property)
            {
                CINE_LOG(RECOMMENDATION, DEBUG, "No property for kind '" << knowledge::getPropertyKindName(kind) << "', ignoring negation");
                continue;
            }

            filters.excluded.push_back(knowledge::PropertyValue{ *property, entity });
        }

        return filters;
    }
} // namespace cine::recommendation
