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

#include <cstddef>
#include <memory>

#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Types.hpp"

namespace cine::knowledge
{
    class IGraphStore;
    class IVectorIndex;
    class ILabelResolver;
    struct PropertyCatalog;
} // namespace cine::knowledge

namespace cine::session
{
    class Session;
}

namespace cine::recommendation
{
    class IRecommendationService
    {
    public:
        virtual ~IRecommendationService() = default;

        // Never throws because of a failing collaborator, see the degradations of the result
        virtual RecommendationResult getRecommendations(const session::Session& session, std::size_t maxCount) const = 0;
    };

    // Collaborators must outlive the service
    std::unique_ptr<IRecommendationService> createRecommendationService(const knowledge::IGraphStore& graphStore,
                                                                        const knowledge::IVectorIndex& vectorIndex,
                                                                        const knowledge::ILabelResolver& labelResolver,
                                                                        const knowledge::PropertyCatalog& catalog,
                                                                        const RecommendationSettings& settings);
} // namespace cine::recommendation
