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
#include <string_view>

#include "services/knowledge/IGraphStore.hpp"
#include "services/knowledge/ILabelResolver.hpp"
#include "services/knowledge/PropertyCatalog.hpp"

namespace cine::knowledge
{
    // Graph held in memory, built from triples
    class IInMemoryGraphStore : public IGraphStore, public ILabelResolver
    {
    public:
        // Reads "subject<TAB>predicate<TAB>object" lines, '#' starts a comment line
        virtual void load(const std::filesystem::path& triplesFile) = 0;

        virtual void addTriple(std::string_view subject, std::string_view predicate, std::string_view object) = 0;
        virtual std::size_t getTripleCount() const = 0;
    };

    std::unique_ptr<IInMemoryGraphStore> createInMemoryGraphStore(const PropertyCatalog& catalog);
} // namespace cine::knowledge
