/*
 * Copyright (C) 2024 Emeric Poupon
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

#include "guid/Guid.hpp"

#include <ostream>
#include <span>

#include "guid/Exception.hpp"
#include "guid/GuidParser.hpp"

namespace guidkit::core::stringUtils
{
    template<>
    std::optional<guid::Guid> readAs(std::string_view str)
    {
        return guid::Guid::fromString(str);
    }
} // namespace guidkit::core::stringUtils

namespace guidkit::guid
{
    std::optional<Guid> Guid::fromString(std::string_view str)
    {
        const ParseResult result{ parseGuid(str) };
        if (!result)
            return std::nullopt;

        return result.value();
    }

    Guid Guid::parse(std::string_view str)
    {
        const ParseResult result{ parseGuid(str) };
        if (!result)
            throw ParseException{ str, result.error() };

        return result.value();
    }

    std::string Guid::toString() const
    {
        // Form is "{6B29FC40-CA47-1067-B31D-00DD010662DA}"
        const Bytes bytes{ toBytes() };
        const std::span<const std::uint8_t> byteSpan{ bytes };

        std::string res;
        res.reserve(details::canonicalLength);

        res += '{';
        res += core::stringUtils::toHexString(byteSpan.subspan(0, 4));
        res += '-';
        res += core::stringUtils::toHexString(byteSpan.subspan(4, 2));
        res += '-';
        res += core::stringUtils::toHexString(byteSpan.subspan(6, 2));
        res += '-';
        res += core::stringUtils::toHexString(byteSpan.subspan(8, 2));
        res += '-';
        res += core::stringUtils::toHexString(byteSpan.subspan(10, 6));
        res += '}';

        return res;
    }

    std::ostream& operator<<(std::ostream& os, const Guid& guid)
    {
        os << guid.toString();
        return os;
    }
} // namespace guidkit::guid
