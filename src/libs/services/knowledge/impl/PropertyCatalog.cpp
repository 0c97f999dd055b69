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

#include "services/knowledge/PropertyCatalog.hpp"

#include <string>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"

namespace cine::knowledge
{
    std::optional<PropertyRef> PropertyCatalog::getProperty(PropertyKind kind) const
    {
        const auto it{ properties.find(kind) };
        if (it == std::cend(properties))
            return std::nullopt;

        return it->second;
    }

    PropertyValue PropertyCatalog::getRecommendableTypeFilter() const
    {
        return PropertyValue{ instanceOf, recommendableType };
    }

    PropertyCatalog createDefaultPropertyCatalog()
    {
        PropertyCatalog catalog;

        catalog.properties = {
            { PropertyKind::Genre, "P136" },
            { PropertyKind::Director, "P57" },
            { PropertyKind::Actor, "P161" },
            { PropertyKind::Screenwriter, "P58" },
            { PropertyKind::Composer, "P86" },
            { PropertyKind::Producer, "P162" },
            { PropertyKind::CountryOfOrigin, "P495" },
            { PropertyKind::Language, "P407" },
            { PropertyKind::Series, "P179" },
            { PropertyKind::BasedOn, "P4969" },
        };

        return catalog;
    }

    PropertyCatalog loadPropertyCatalog(core::IConfig& config)
    {
        PropertyCatalog catalog{ createDefaultPropertyCatalog() };

        auto readRef{ [&](std::string_view setting, PropertyRef& ref) {
            ref = std::string{ config.getString(setting, std::string{ ref }) };
        } };

        readRef("property-label", catalog.label);
        readRef("property-instance-of", catalog.instanceOf);
        readRef("recommendable-type", catalog.recommendableType);
        readRef("property-publication-date", catalog.publicationDate);
        readRef("property-rating", catalog.rating);
        readRef("property-image", catalog.image);

        for (const PropertyKind kind : getAllPropertyKinds())
        {
            const std::string setting{ "property-" + std::string{ getPropertyKindName(kind) } };
            const std::string ref{ config.getString(setting, catalog.properties[kind]) };
            if (ref.empty())
            {
                CINE_LOG(CONFIG, INFO, "Property kind '" << getPropertyKindName(kind) << "' disabled");
                catalog.properties.erase(kind);
            }
            else
                catalog.properties[kind] = ref;
        }

        return catalog;
    }
} // namespace cine::knowledge
