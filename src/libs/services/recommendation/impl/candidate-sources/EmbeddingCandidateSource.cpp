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

#include "EmbeddingCandidateSource.hpp"

#include "core/ILogger.hpp"
#include "services/knowledge/IVectorIndex.hpp"

namespace cine::recommendation::CandidateSource
{
    static_assert(EmbeddingCandidateSource::similarityReason.find(EmbeddingCandidateSource::similarityMarker) != std::string_view::npos);

    EmbeddingCandidateSource::EmbeddingCandidateSource(const knowledge::IVectorIndex& vectorIndex, const RecommendationSettings& settings)
        : _vectorIndex{ vectorIndex }
        , _settings{ settings }
    {
    }

    CandidateMap EmbeddingCandidateSource::findFromSeeds(const knowledge::EntitySet& seeds, const knowledge::EntitySet& exclude) const
    {
        CandidateMap candidates;

        for (const knowledge::EntityId& seed : seeds)
        {
            try
            {
                for (auto& [entityId, seedCandidate] : findFromSeed(seed, exclude))
                {
                    Candidate& candidate{ candidates[entityId] };
                    candidate.score += seedCandidate.score;
                    candidate.reasons.merge(seedCandidate.reasons);
                }
            }
            catch (const std::exception& e)
            {
                CINE_LOG(EMBEDDING, ERROR, "Neighbor lookup failed for seed '" << seed << "': " << e.what());
            }
        }

        return candidates;
    }

    CandidateMap EmbeddingCandidateSource::findFromSeed(const knowledge::EntityId& seed, const knowledge::EntitySet& exclude) const
    {
        CandidateMap candidates;

        if (!_vectorIndex.getEmbedding(seed))
        {
            CINE_LOG(EMBEDDING, DEBUG, "No embedding for seed '" << seed << "', skipping");
            return candidates;
        }

        for (const knowledge::Neighbor& neighbor : _vectorIndex.findNearestNeighbors(seed, _settings.embeddingNeighborCount))
        {
            if (exclude.contains(neighbor.id))
                continue;

            Candidate& candidate{ candidates[neighbor.id] };
            candidate.score += neighbor.similarity;
            candidate.reasons.emplace(similarityReason);
        }

        return candidates;
    }
} // namespace cine::recommendation::CandidateSource
