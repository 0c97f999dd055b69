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

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cine::knowledge
{
    // Opaque identifiers of the external knowledge graph (e.g. "Q11424", "P136")
    using EntityId = std::string;
    using PropertyRef = std::string;
    using EntitySet = std::set<EntityId>;

    // Property categories the conversation can talk about
    enum class PropertyKind
    {
        Genre,
        Director,
        Actor,
        Screenwriter,
        Composer,
        Producer,
        CountryOfOrigin,
        Language,
        Series,
        BasedOn,
    };

    std::optional<PropertyKind> parsePropertyKind(std::string_view str);
    std::string_view getPropertyKindName(PropertyKind kind);
    const std::vector<PropertyKind>& getAllPropertyKinds();

    struct PropertyValue
    {
        PropertyRef property;
        EntityId value;

        bool operator==(const PropertyValue&) const = default;
    };

    // Store level predicates, shared by candidate generation and verification
    struct QueryFilters
    {
        std::optional<PropertyValue> requiredType;
        std::vector<PropertyValue> required;
        std::vector<PropertyValue> excluded;
        std::optional<int> minYear; // inclusive
        std::optional<int> maxYear; // inclusive
        std::optional<double> minRating;

        bool operator==(const QueryFilters&) const = default;
    };
} // namespace cine::knowledge
