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

#include "GraphCandidateSource.hpp"

#include <algorithm>

#include "core/ILogger.hpp"
#include "services/knowledge/IGraphStore.hpp"

namespace cine::recommendation::CandidateSource
{
    GraphCandidateSource::GraphCandidateSource(const knowledge::IGraphStore& graphStore, const knowledge::PropertyCatalog& catalog, const RecommendationSettings& settings)
        : _graphStore{ graphStore }
        , _catalog{ catalog }
        , _settings{ settings }
    {
    }

    CandidateMap GraphCandidateSource::findFromSeeds(const knowledge::EntitySet& seeds, const knowledge::QueryFilters& filters, const knowledge::EntitySet& exclude) const
    {
        CandidateMap candidates;
        if (seeds.empty())
            return candidates;

        for (const SharedPropertyCategory& category : _settings.sharedPropertyCategories)
        {
            try
            {
                for (auto& [entityId, categoryCandidate] : findFromCategory(category, seeds, filters, exclude))
                {
                    Candidate& candidate{ candidates[entityId] };
                    candidate.score += categoryCandidate.score;
                    candidate.reasons.merge(categoryCandidate.reasons);
                    candidate.qualitySignal = std::max(candidate.qualitySignal, categoryCandidate.qualitySignal);
                }
            }
            catch (const std::exception& e)
            {
                CINE_LOG(RECOMMENDATION, ERROR, "Shared property query failed for category '" << knowledge::getPropertyKindName(category.kind) << "': " << e.what());
            }
        }

        return candidates;
    }

    CandidateMap GraphCandidateSource::findFromCategory(const SharedPropertyCategory& category, const knowledge::EntitySet& seeds, const knowledge::QueryFilters& filters, const knowledge::EntitySet& exclude) const
    {
        CandidateMap candidates;
        if (seeds.empty())
            return candidates;

        const std::optional<knowledge::PropertyRef> property{ _catalog.getProperty(category.kind) };
        if (!property)
        {
            CINE_LOG(RECOMMENDATION, DEBUG, "No property for kind '" << knowledge::getPropertyKindName(category.kind) << "', skipping category");
            return candidates;
        }

        const std::vector<knowledge::GraphRow> rows{ _graphStore.query(knowledge::SharedPropertyPattern{ seeds, *property, _settings.graphQueryLimit }, filters, exclude) };
        for (const knowledge::GraphRow& row : rows)
        {
            if (exclude.contains(row.entity))
                continue;

            Candidate& candidate{ candidates[row.entity] };
            candidate.score += category.weight;
            candidate.reasons.insert(category.reasonTemplate + " '" + row.matchedValueLabel.value_or(std::string{ unknownValueLabel }) + "'");
            candidate.qualitySignal = std::max(candidate.qualitySignal, row.qualitySignal.value_or(0));
        }

        CINE_LOG(RECOMMENDATION, DEBUG, "Category '" << knowledge::getPropertyKindName(category.kind) << "': " << rows.size() << " rows");

        return candidates;
    }

    CandidateMap GraphCandidateSource::findFromPreferences(const session::Preferences& preferences, const knowledge::QueryFilters& filters, const knowledge::EntitySet& exclude) const
    {
        CandidateMap candidates;

        std::vector<knowledge::PropertyValue> required;
        for (const auto& [kind, entity] : preferences)
        {
            if (const std::optional<knowledge::PropertyRef> property{ _catalog.getProperty(kind) })
                required.push_back(knowledge::PropertyValue{ *property, entity });
            else
                CINE_LOG(RECOMMENDATION, DEBUG, "No property for kind '" << knowledge::getPropertyKindName(kind) << "', ignoring preference");
        }

        if (required.empty())
            return candidates;

        std::vector<knowledge::GraphRow> rows;
        try
        {
            rows = _graphStore.query(knowledge::PropertyMatchPattern{ std::move(required), _settings.graphQueryLimit }, filters, exclude);
        }
        catch (const std::exception& e)
        {
            CINE_LOG(RECOMMENDATION, ERROR, "Preference query failed: " << e.what());
            return candidates;
        }

        for (const knowledge::GraphRow& row : rows)
        {
            if (exclude.contains(row.entity))
                continue;

            Candidate& candidate{ candidates[row.entity] };
            candidate.score += _settings.preferenceMatchScore;
            candidate.reasons.emplace(preferenceReason);
            candidate.qualitySignal = std::max(candidate.qualitySignal, row.qualitySignal.value_or(0));
        }

        return candidates;
    }
} // namespace cine::recommendation::CandidateSource
