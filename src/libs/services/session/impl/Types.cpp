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

#include "services/session/Types.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace cine::session
{
    namespace
    {
        constexpr std::array<std::pair<Comparison, std::string_view>, 5> comparisonSymbols{ {
            { Comparison::Less, "<" },
            { Comparison::LessOrEqual, "<=" },
            { Comparison::Equal, "=" },
            { Comparison::GreaterOrEqual, ">=" },
            { Comparison::Greater, ">" },
        } };
    } // namespace

    std::optional<Comparison> parseComparison(std::string_view str)
    {
        if (str == "==")
            return Comparison::Equal;

        const auto it{ std::find_if(std::cbegin(comparisonSymbols), std::cend(comparisonSymbols), [&](const auto& entry) { return entry.second == str; }) };
        if (it == std::cend(comparisonSymbols))
            return std::nullopt;

        return it->first;
    }

    std::string_view getComparisonSymbol(Comparison comparison)
    {
        const auto it{ std::find_if(std::cbegin(comparisonSymbols), std::cend(comparisonSymbols), [&](const auto& entry) { return entry.first == comparison; }) };
        return it != std::cend(comparisonSymbols) ? it->second : std::string_view{};
    }

    ConstraintKind getConstraintKind(const Constraint& constraint)
    {
        struct Visitor
        {
            ConstraintKind operator()(const YearConstraint&) const { return ConstraintKind::Year; }
            ConstraintKind operator()(const YearRangeConstraint&) const { return ConstraintKind::YearRange; }
            ConstraintKind operator()(const LanguageConstraint&) const { return ConstraintKind::Language; }
            ConstraintKind operator()(const MinRatingConstraint&) const { return ConstraintKind::MinRating; }
        };

        return std::visit(Visitor{}, constraint);
    }
} // namespace cine::session
