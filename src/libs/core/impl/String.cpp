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

#include "core/String.hpp"

#include <Wt/WDateTime.h>

namespace guidkit::core::stringUtils
{
    namespace
    {
        constexpr char toLowerAscii(char c)
        {
            if (c >= 'A' && c <= 'Z')
                return static_cast<char>(c - 'A' + 'a');
            return c;
        }
    } // namespace

    std::vector<std::string_view> splitString(std::string_view str, std::string_view separator)
    {
        std::vector<std::string_view> res;

        if (!separator.empty())
        {
            std::size_t currentPos{};
            for (std::size_t separatorPos{ str.find(separator) }; separatorPos != std::string_view::npos; separatorPos = str.find(separator, currentPos))
            {
                res.push_back(str.substr(currentPos, separatorPos - currentPos));
                currentPos = separatorPos + separator.size();
            }

            str.remove_prefix(currentPos);
        }

        res.push_back(str);
        return res;
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        if (strA.size() != strB.size())
            return false;

        for (std::size_t i{}; i < strA.size(); ++i)
        {
            if (toLowerAscii(strA[i]) != toLowerAscii(strB[i]))
                return false;
        }

        return true;
    }

    std::string toHexString(std::span<const std::uint8_t> bytes)
    {
        constexpr char lut[]{ "0123456789ABCDEF" };

        std::string res;
        res.reserve(bytes.size() * 2);

        for (const std::uint8_t byte : bytes)
        {
            res.push_back(lut[(byte >> 4) & 0xF]);
            res.push_back(lut[byte & 0xF]);
        }

        return res;
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }
} // namespace guidkit::core::stringUtils
