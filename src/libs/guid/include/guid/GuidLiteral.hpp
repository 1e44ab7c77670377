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

#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "guid/Guid.hpp"
#include "guid/GuidParser.hpp"

// Compile time GUID literals:
//   using namespace guidkit::guid::literals;
//   constexpr Guid myGuid{ "{6B29FC40-CA47-1067-B31D-00DD010662DA}"_guid };
// An invalid literal does not compile. The diagnostic shows an instantiation of
// InvalidGuidLiteral<kind, position, character, input length> for the parse error.
namespace guidkit::guid
{
    namespace details
    {
        template<std::size_t N>
        struct FixedString
        {
            constexpr FixedString(const char (&str)[N])
            {
                std::copy_n(str, N, value);
            }

            constexpr std::string_view view() const { return std::string_view{ value, N - 1 }; }

            char value[N]{};
        };

        template<ParseErrorKind Kind>
        inline constexpr bool alwaysFalse{ false };

        // Position and Character are 0 for LengthMismatch
        template<ParseErrorKind Kind, std::size_t Position, char Character, std::size_t InputLength>
        struct InvalidGuidLiteral
        {
            static_assert(alwaysFalse<Kind>, "invalid GUID literal, see the InvalidGuidLiteral template arguments");
        };
    } // namespace details

    namespace literals
    {
        template<details::FixedString Str>
        consteval Guid operator""_guid()
        {
            constexpr ParseResult result{ parseGuid(Str.view()) };
            if constexpr (!result.hasValue())
            {
                constexpr ParseError error{ result.error() };
                static_cast<void>(sizeof(details::InvalidGuidLiteral<error.getKind(), error.getPosition(), error.getCharacter(), Str.view().size()>));
                return Guid{};
            }
            else
            {
                return result.value();
            }
        }
    } // namespace literals
} // namespace guidkit::guid
