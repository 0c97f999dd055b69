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

#include <map>

#include "services/knowledge/IInMemoryVectorIndex.hpp"

namespace cine::knowledge
{
    class InMemoryVectorIndex final : public IInMemoryVectorIndex
    {
    public:
        InMemoryVectorIndex() = default;
        ~InMemoryVectorIndex() override = default;
        InMemoryVectorIndex(const InMemoryVectorIndex&) = delete;
        InMemoryVectorIndex& operator=(const InMemoryVectorIndex&) = delete;

    private:
        void load(const std::filesystem::path& embeddingsFile) override;
        void addEmbedding(const EntityId& id, const Embedding& embedding) override;
        std::size_t getDimensionCount() const override;
        std::size_t getEmbeddingCount() const override;

        std::vector<Neighbor> findNearestNeighbors(const EntityId& id, std::size_t k) const override;
        std::optional<Embedding> getEmbedding(const EntityId& id) const override;
        float computeCosineSimilarity(std::span<const float> a, std::span<const float> b) const override;

        std::size_t _dimensionCount{};
        std::map<EntityId, Embedding> _embeddings; // normalized
    };
} // namespace cine::knowledge
