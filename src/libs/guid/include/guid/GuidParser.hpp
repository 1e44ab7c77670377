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
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "guid/Guid.hpp"
#include "guid/ParseError.hpp"

namespace guidkit::guid
{
    // Holds either the parsed GUID or the reason why parsing failed
    class ParseResult
    {
    public:
        constexpr ParseResult(const Guid& guid)
            : _result{ guid } {}
        constexpr ParseResult(const ParseError& error)
            : _result{ error } {}

        constexpr bool hasValue() const { return std::holds_alternative<Guid>(_result); }
        constexpr explicit operator bool() const { return hasValue(); }

        // throws std::bad_variant_access if no value
        constexpr const Guid& value() const { return std::get<Guid>(_result); }
        // throws std::bad_variant_access if there is a value
        constexpr const ParseError& error() const { return std::get<ParseError>(_result); }

    private:
        std::variant<Guid, ParseError> _result;
    };

    namespace details
    {
        // {XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX}
        // 0        9    14   19   24          37
        inline constexpr std::size_t canonicalLength{ 38 };
        inline constexpr std::size_t openBracePosition{ 0 };
        inline constexpr std::size_t closeBracePosition{ 37 };
        inline constexpr std::array<std::size_t, 4> separatorPositions{ 9, 14, 19, 24 };

        struct DigitGroup
        {
            std::size_t position;
            std::size_t length;
        };
        inline constexpr DigitGroup data1Group{ 1, 8 };
        inline constexpr DigitGroup data2Group{ 10, 4 };
        inline constexpr DigitGroup data3Group{ 15, 4 };
        inline constexpr DigitGroup data4HighGroup{ 20, 4 };
        inline constexpr DigitGroup data4LowGroup{ 25, 12 };

        constexpr bool isSeparatorPosition(std::size_t position)
        {
            return std::find(std::cbegin(separatorPositions), std::cend(separatorPositions), position) != std::cend(separatorPositions);
        }

        // Locale independent
        constexpr std::optional<std::uint8_t> getHexDigitValue(char c)
        {
            if (c >= '0' && c <= '9')
                return static_cast<std::uint8_t>(c - '0');
            if (c >= 'a' && c <= 'f')
                return static_cast<std::uint8_t>(c - 'a' + 10);
            if (c >= 'A' && c <= 'F')
                return static_cast<std::uint8_t>(c - 'A' + 10);

            return std::nullopt;
        }

        // digits must have been validated
        template<typename T>
        constexpr T decodeHex(std::string_view digits)
        {
            T value{};
            for (const char c : digits)
                value = static_cast<T>((value << 4) | *getHexDigitValue(c));

            return value;
        }

        template<typename T>
        constexpr T decodeGroup(std::string_view str, const DigitGroup& group)
        {
            return decodeHex<T>(str.substr(group.position, group.length));
        }

        // Appends the bytes of a group, two digits per byte, left to right
        template<std::size_t N>
        constexpr std::size_t decodeBytes(std::string_view str, const DigitGroup& group, std::array<std::uint8_t, N>& bytes, std::size_t byteIndex)
        {
            for (std::size_t i{}; i < group.length; i += 2)
                bytes[byteIndex++] = decodeHex<std::uint8_t>(str.substr(group.position + i, 2));

            return byteIndex;
        }
    } // namespace details

    // Parses the canonical form "{XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX}", hex digits are case insensitive
    // Checks are made in this order, the first failure is reported:
    // length, braces, separators, then hex digits from left to right
    // Usable in constant expressions, see GuidLiteral.hpp
    constexpr ParseResult parseGuid(std::string_view str)
    {
        using namespace details;

        if (str.size() != canonicalLength)
            return ParseError::lengthMismatch(canonicalLength, str.size());

        if (str[openBracePosition] != '{')
            return ParseError::missingOpenBrace(openBracePosition, str[openBracePosition]);
        if (str[closeBracePosition] != '}')
            return ParseError::missingCloseBrace(closeBracePosition, str[closeBracePosition]);

        for (const std::size_t position : separatorPositions)
        {
            if (str[position] != '-')
                return ParseError::missingSeparator(position, str[position]);
        }

        std::size_t digitIndex{};
        for (std::size_t position{ openBracePosition + 1 }; position < closeBracePosition; ++position)
        {
            if (isSeparatorPosition(position))
                continue;

            if (!getHexDigitValue(str[position]))
                return ParseError::invalidHexDigit(position, digitIndex, str[position]);

            ++digitIndex;
        }

        Guid::Data4 data4{};
        const std::size_t byteIndex{ decodeBytes(str, data4HighGroup, data4, 0) };
        decodeBytes(str, data4LowGroup, data4, byteIndex);

        return Guid{
            decodeGroup<std::uint32_t>(str, data1Group),
            decodeGroup<std::uint16_t>(str, data2Group),
            decodeGroup<std::uint16_t>(str, data3Group),
            data4,
        };
    }
} // namespace guidkit::guid
