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

#include "services/knowledge/Types.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace cine::knowledge
{
    class IGraphStore;
}

namespace cine::recommendation
{
    // Re-validates merged candidates against the store, in a single batch
    class ConstraintFilter
    {
    public:
        ConstraintFilter(const knowledge::IGraphStore& graphStore, const RecommendationSettings& settings);

        // fails open: on verification error, the input is returned unchanged
        Outcome<CandidateMap> filter(const CandidateMap& candidates, const knowledge::QueryFilters& filters) const;

        // keeps the highest scored candidates (ties: lowest entity id first)
        CandidateMap truncate(const CandidateMap& candidates) const;

    private:
        const knowledge::IGraphStore& _graphStore;
        const RecommendationSettings& _settings;
    };
} // namespace cine::recommendation
