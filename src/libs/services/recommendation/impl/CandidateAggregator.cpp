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

#include "CandidateAggregator.hpp"

#include <algorithm>

#include "core/ILogger.hpp"

namespace cine::recommendation
{
    CandidateAggregator::CandidateAggregator(const RecommendationSettings& settings)
        : _settings{ settings }
    {
    }

    void CandidateAggregator::merge(CandidateMap& main, const CandidateMap& source, CandidateSourceKind sourceKind) const
    {
        const double weight{ _settings.getSourceWeight(sourceKind) };

        for (const auto& [entityId, sourceCandidate] : source)
        {
            Candidate& candidate{ main[entityId] };
            candidate.score += sourceCandidate.score * weight;
            candidate.reasons.insert(std::cbegin(sourceCandidate.reasons), std::cend(sourceCandidate.reasons));
            candidate.qualitySignal = std::max(candidate.qualitySignal, sourceCandidate.qualitySignal);
        }

        CINE_LOG(RECOMMENDATION, DEBUG, "Merged " << source.size() << " candidates from " << getCandidateSourceKindName(sourceKind) << ", total = " << main.size());
    }
} // namespace cine::recommendation
