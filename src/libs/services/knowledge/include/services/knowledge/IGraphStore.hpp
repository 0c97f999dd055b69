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
#include <string>
#include <variant>
#include <vector>

#include "services/knowledge/Types.hpp"

namespace cine::knowledge
{
    // Entities sharing a value of the given property with at least one seed
    struct SharedPropertyPattern
    {
        EntitySet seeds;
        PropertyRef property;
        std::size_t limit{};
    };

    // Entities having all the required property values
    struct PropertyMatchPattern
    {
        std::vector<PropertyValue> required;
        std::size_t limit{};
    };

    using GraphPattern = std::variant<SharedPropertyPattern, PropertyMatchPattern>;

    struct GraphRow
    {
        EntityId entity;
        std::optional<EntityId> matchedValue;
        std::optional<std::string> matchedValueLabel;
        std::optional<double> qualitySignal;
    };

    class IGraphStore
    {
    public:
        virtual ~IGraphStore() = default;

        // Entities of the exclude set never show up in the result
        virtual std::vector<GraphRow> query(const GraphPattern& pattern, const QueryFilters& filters, const EntitySet& exclude) const = 0;

        // Returns the subset of ids matching the filters
        virtual EntitySet verifyMembership(const EntitySet& ids, const QueryFilters& filters) const = 0;

        virtual std::optional<std::string> getImage(const EntityId& id) const = 0;
    };
} // namespace cine::knowledge
