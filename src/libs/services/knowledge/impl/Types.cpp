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

#include "services/knowledge/Types.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "core/String.hpp"

namespace cine::knowledge
{
    namespace
    {
        constexpr std::array<std::pair<PropertyKind, std::string_view>, 10> propertyKindNames{ {
            { PropertyKind::Genre, "genre" },
            { PropertyKind::Director, "director" },
            { PropertyKind::Actor, "actor" },
            { PropertyKind::Screenwriter, "screenwriter" },
            { PropertyKind::Composer, "composer" },
            { PropertyKind::Producer, "producer" },
            { PropertyKind::CountryOfOrigin, "country" },
            { PropertyKind::Language, "language" },
            { PropertyKind::Series, "series" },
            { PropertyKind::BasedOn, "based-on" },
        } };
    } // namespace

    std::optional<PropertyKind> parsePropertyKind(std::string_view str)
    {
        const std::string lowered{ core::stringUtils::stringToLower(core::stringUtils::stringTrim(str)) };

        const auto it{ std::find_if(std::cbegin(propertyKindNames), std::cend(propertyKindNames), [&](const auto& entry) { return entry.second == lowered; }) };
        if (it == std::cend(propertyKindNames))
            return std::nullopt;

        return it->first;
    }

    std::string_view getPropertyKindName(PropertyKind kind)
    {
        const auto it{ std::find_if(std::cbegin(propertyKindNames), std::cend(propertyKindNames), [&](const auto& entry) { return entry.first == kind; }) };
        return it != std::cend(propertyKindNames) ? it->second : std::string_view{};
    }

    const std::vector<PropertyKind>& getAllPropertyKinds()
    {
        static const std::vector<PropertyKind> kinds{ [] {
            std::vector<PropertyKind> res;
            for (const auto& [kind, name] : propertyKindNames)
                res.push_back(kind);
            return res;
        }() };

        return kinds;
    }
} // namespace cine::knowledge
