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

#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace cine::recommendation
{
    class CandidateAggregator
    {
    public:
        explicit CandidateAggregator(const RecommendationSettings& settings);

        // scores are summed (weighted by source), reasons united, quality signals maxed
        void merge(CandidateMap& main, const CandidateMap& source, CandidateSourceKind sourceKind) const;

    private:
        const RecommendationSettings& _settings;
    };
} // namespace cine::recommendation
