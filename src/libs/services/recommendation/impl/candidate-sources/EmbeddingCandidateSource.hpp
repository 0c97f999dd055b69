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

#pragma once

#include <string_view>

#include "services/knowledge/Types.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace cine::knowledge
{
    class IVectorIndex;
}

namespace cine::recommendation::CandidateSource
{
    // Candidates close to the seeds in the embedding space, constraints are not honored here
    class EmbeddingCandidateSource
    {
    public:
        EmbeddingCandidateSource(const knowledge::IVectorIndex& vectorIndex, const RecommendationSettings& settings);
        ~EmbeddingCandidateSource() = default;
        EmbeddingCandidateSource(const EmbeddingCandidateSource&) = delete;
        EmbeddingCandidateSource& operator=(const EmbeddingCandidateSource&) = delete;

        // a failing seed lookup is skipped
        CandidateMap findFromSeeds(const knowledge::EntitySet& seeds, const knowledge::EntitySet& exclude) const;

        // empty if the seed has no embedding, throws on index failure
        CandidateMap findFromSeed(const knowledge::EntityId& seed, const knowledge::EntitySet& exclude) const;

        static constexpr std::string_view similarityMarker{ "similar to" };
        static constexpr std::string_view similarityReason{ "it's similar to movies you like" };

    private:
        const knowledge::IVectorIndex& _vectorIndex;
        const RecommendationSettings& _settings;
    };
} // namespace cine::recommendation::CandidateSource
