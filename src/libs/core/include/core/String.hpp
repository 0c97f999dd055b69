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
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Wt
{
    class WDateTime;
} // namespace Wt

namespace cine::core::stringUtils
{
    [[nodiscard]] std::vector<std::string_view> splitString(std::string_view string, char separator);
    [[nodiscard]] std::vector<std::string_view> splitString(std::string_view string, std::string_view separator);

    [[nodiscard]] std::string_view stringTrim(std::string_view str, std::string_view whitespaces = " \t\r\n");

    [[nodiscard]] std::string stringToLower(std::string_view str);

    template<typename T>
    [[nodiscard]] std::optional<T> readAs(std::string_view str)
    {
        T res;
        std::istringstream iss{ std::string{ str } };
        iss >> res;
        if (iss.fail() || !(iss >> std::ws).eof())
            return std::nullopt;

        return res;
    }

    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);
} // namespace cine::core::stringUtils
