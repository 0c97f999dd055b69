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

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "services/knowledge/Types.hpp"
#include "services/recommendation/Types.hpp"

namespace cine::core
{
    class IConfig;
}

namespace cine::recommendation
{
    // Tracked category of the graph candidate source
    struct SharedPropertyCategory
    {
        knowledge::PropertyKind kind;
        double weight{};
        std::string reasonTemplate;

        bool operator==(const SharedPropertyCategory&) const = default;
    };

    struct RecommendationSettings
    {
        double graphPreferenceWeight{ 2.0 };
        double graphSeedWeight{ 1.0 };
        double embeddingSeedWeight{ 0.1 };

        std::vector<SharedPropertyCategory> sharedPropertyCategories{ getDefaultSharedPropertyCategories() };
        double preferenceMatchScore{ 2.0 };
        std::size_t graphQueryLimit{ 20 };

        std::size_t embeddingNeighborCount{ 20 };

        std::size_t filterCandidateCap{ 200 };

        double ratingWeight{ 0.02 };

        double diversityLambda{ 0.7 };

        std::size_t threadCount{ 2 };
        std::chrono::milliseconds externalCallTimeout{ 5000 };

        double getSourceWeight(CandidateSourceKind kind) const;

        static std::vector<SharedPropertyCategory> getDefaultSharedPropertyCategories();
    };

    // Missing settings keep their default value, throws on malformed entries
    RecommendationSettings loadRecommendationSettings(core::IConfig& config);
} // namespace cine::recommendation
