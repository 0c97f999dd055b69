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

#include <filesystem>
#include <memory>

#include "services/knowledge/IVectorIndex.hpp"

namespace cine::knowledge
{
    class IInMemoryVectorIndex : public IVectorIndex
    {
    public:
        // Reads "entity<TAB>v1 v2 ... vn" lines, all vectors must have the same dimension
        virtual void load(const std::filesystem::path& embeddingsFile) = 0;

        // Vectors are stored L2-normalized
        virtual void addEmbedding(const EntityId& id, const Embedding& embedding) = 0;

        virtual std::size_t getDimensionCount() const = 0;
        virtual std::size_t getEmbeddingCount() const = 0;
    };

    std::unique_ptr<IInMemoryVectorIndex> createInMemoryVectorIndex();
} // namespace cine::knowledge
