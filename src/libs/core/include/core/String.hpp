/*
 * Copyright (C) 2019 Emeric Poupon
 *
 * This file is part of Guidkit.
 *
 * Guidkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Guidkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Guidkit.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Wt
{
    class WDateTime;
} // namespace Wt

namespace guidkit::core::stringUtils
{
    [[nodiscard]] std::vector<std::string_view> splitString(std::string_view string, std::string_view separator);

    [[nodiscard]] bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB);

    template<typename T>
    [[nodiscard]] std::optional<T> readAs(std::string_view str)
    {
        T res;
        std::istringstream iss{ std::string{ str } };
        iss >> res;
        if (iss.fail())
            return std::nullopt;

        return res;
    }

    // Upper case, two digits per byte
    [[nodiscard]] std::string toHexString(std::span<const std::uint8_t> bytes);

    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);
} // namespace guidkit::core::stringUtils
