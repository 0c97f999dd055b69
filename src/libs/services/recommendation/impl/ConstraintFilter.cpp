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

#include "ConstraintFilter.hpp"

#include <algorithm>
#include <vector>

#include "core/ILogger.hpp"
#include "services/knowledge/IGraphStore.hpp"

namespace cine::recommendation
{
    ConstraintFilter::ConstraintFilter(const knowledge::IGraphStore& graphStore, const RecommendationSettings& settings)
        : _graphStore{ graphStore }
        , _settings{ settings }
    {
    }

    Outcome<CandidateMap> ConstraintFilter::filter(const CandidateMap& candidates, const knowledge::QueryFilters& filters) const
    {
        if (candidates.empty())
            return { candidates, std::nullopt };

        // TODO verify the dropped candidates in additional batches instead of discarding them
        const CandidateMap truncatedCandidates{ truncate(candidates) };

        knowledge::EntitySet ids;
        for (const auto& [entityId, candidate] : truncatedCandidates)
            ids.insert(entityId);

        knowledge::EntitySet validIds;
        try
        {
            validIds = _graphStore.verifyMembership(ids, filters);
        }
        catch (const std::exception& e)
        {
            CINE_LOG(RECOMMENDATION, ERROR, "Candidate verification failed, keeping unverified candidates: " << e.what());
            return { candidates, Degradation{ DegradationKind::FilterVerificationFailed, e.what() } };
        }

        CandidateMap res;
        for (const auto& [entityId, candidate] : truncatedCandidates)
        {
            if (validIds.contains(entityId))
                res.emplace(entityId, candidate);
        }

        CINE_LOG(RECOMMENDATION, DEBUG, "Filtered " << candidates.size() << " candidates down to " << res.size());

        return { std::move(res), std::nullopt };
    }

    CandidateMap ConstraintFilter::truncate(const CandidateMap& candidates) const
    {
        if (candidates.size() <= _settings.filterCandidateCap)
            return candidates;

        std::vector<CandidateMap::const_iterator> sortedCandidates;
        sortedCandidates.reserve(candidates.size());
        for (auto it{ std::cbegin(candidates) }; it != std::cend(candidates); ++it)
            sortedCandidates.push_back(it);

        // map iteration order gives the ascending entity id tie break
        std::stable_sort(std::begin(sortedCandidates), std::end(sortedCandidates), [](CandidateMap::const_iterator lhs, CandidateMap::const_iterator rhs) {
            return lhs->second.score > rhs->second.score;
        });
        sortedCandidates.resize(_settings.filterCandidateCap);

        CINE_LOG(RECOMMENDATION, DEBUG, "Dropping " << (candidates.size() - sortedCandidates.size()) << " low scored candidates before verification");

        CandidateMap res;
        for (const CandidateMap::const_iterator it : sortedCandidates)
            res.emplace(it->first, it->second);

        return res;
    }
} // namespace cine::recommendation
