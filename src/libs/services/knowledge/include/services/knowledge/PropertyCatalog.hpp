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
#include <optional>

#include "services/knowledge/Types.hpp"

namespace cine::core
{
    class IConfig;
}

namespace cine::knowledge
{
    // Maps property kinds and special predicates to store references
    struct PropertyCatalog
    {
        PropertyRef label{ "rdfs:label" };
        PropertyRef instanceOf{ "P31" };
        EntityId recommendableType{ "Q11424" }; // film
        PropertyRef publicationDate{ "P577" };
        PropertyRef rating{ "ddis:rating" };
        PropertyRef image{ "P18" };

        std::map<PropertyKind, PropertyRef> properties;

        std::optional<PropertyRef> getProperty(PropertyKind kind) const;
        PropertyValue getRecommendableTypeFilter() const;
    };

    PropertyCatalog createDefaultPropertyCatalog();

    // "property-<kind>" settings override the default references, an empty value disables the kind
    PropertyCatalog loadPropertyCatalog(core::IConfig& config);
} // namespace cine::knowledge
