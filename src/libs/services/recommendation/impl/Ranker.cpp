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

#include "Ranker.hpp"

#include <algorithm>

#include "candidate-sources/EmbeddingCandidateSource.hpp"

namespace cine::recommendation
{
    Ranker::Ranker(const RecommendationSettings& settings)
        : _settings{ settings }
    {
    }

    RankedList Ranker::rank(const CandidateMap& candidates) const
    {
        RankedList rankedList;
        rankedList.reserve(candidates.size());

        for (const auto& [entityId, candidate] : candidates)
            rankedList.push_back(RankedEntry{ entityId, candidate.score + candidate.qualitySignal * _settings.ratingWeight, selectReason(candidate) });

        std::stable_sort(std::begin(rankedList), std::end(rankedList), [](const RankedEntry& lhs, const RankedEntry& rhs) { return lhs.score > rhs.score; });

        return rankedList;
    }

    std::string Ranker::selectReason(const Candidate& candidate)
    {
        using CandidateSource::EmbeddingCandidateSource;

        // reasons are ordered
        const auto itStructuredReason{ std::find_if(std::cbegin(candidate.reasons), std::cend(candidate.reasons), [](const std::string& reason) {
            return reason.find(EmbeddingCandidateSource::similarityMarker) == std::string::npos;
        }) };
        if (itStructuredReason != std::cend(candidate.reasons))
            return *itStructuredReason;

        if (!candidate.reasons.empty())
            return *std::cbegin(candidate.reasons);

        return std::string{ defaultReason };
    }
} // namespace cine::recommendation
