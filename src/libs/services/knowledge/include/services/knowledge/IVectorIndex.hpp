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
#include <optional>
#include <span>
#include <vector>

#include "services/knowledge/Types.hpp"

namespace cine::knowledge
{
    using Embedding = std::vector<float>;

    struct Neighbor
    {
        EntityId id;
        float similarity{};
    };

    class IVectorIndex
    {
    public:
        virtual ~IVectorIndex() = default;

        // Nearest entities by cosine similarity, most similar first, the entity itself excluded
        virtual std::vector<Neighbor> findNearestNeighbors(const EntityId& id, std::size_t k) const = 0;
        virtual std::optional<Embedding> getEmbedding(const EntityId& id) const = 0;

        // Throws if dimensions differ
        virtual float computeCosineSimilarity(std::span<const float> a, std::span<const float> b) const = 0;
    };
} // namespace cine::knowledge
