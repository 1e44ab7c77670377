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

#include <cstddef>
#include <iosfwd>
#include <string>

namespace guidkit::guid
{
    enum class ParseErrorKind
    {
        LengthMismatch,
        MissingOpenBrace,
        MissingCloseBrace,
        MissingSeparator,
        InvalidHexDigit,
    };

    const char* getParseErrorKindName(ParseErrorKind kind);

    // Describes the first structural check that failed while parsing a GUID
    // Positions are 0-based offsets in the input string
    class ParseError
    {
    public:
        static constexpr ParseError lengthMismatch(std::size_t expectedLength, std::size_t actualLength)
        {
            ParseError error{ ParseErrorKind::LengthMismatch };
            error._expectedLength = expectedLength;
            error._actualLength = actualLength;
            return error;
        }

        static constexpr ParseError missingOpenBrace(std::size_t position, char actual)
        {
            return ParseError{ ParseErrorKind::MissingOpenBrace, position, actual };
        }

        static constexpr ParseError missingCloseBrace(std::size_t position, char actual)
        {
            return ParseError{ ParseErrorKind::MissingCloseBrace, position, actual };
        }

        static constexpr ParseError missingSeparator(std::size_t position, char actual)
        {
            return ParseError{ ParseErrorKind::MissingSeparator, position, actual };
        }

        // digitIndex is the index of the offending character among the 32 hex digits
        static constexpr ParseError invalidHexDigit(std::size_t position, std::size_t digitIndex, char actual)
        {
            ParseError error{ ParseErrorKind::InvalidHexDigit, position, actual };
            error._digitIndex = digitIndex;
            return error;
        }

        constexpr ParseErrorKind getKind() const { return _kind; }

        // LengthMismatch only
        constexpr std::size_t getExpectedLength() const { return _expectedLength; }
        constexpr std::size_t getActualLength() const { return _actualLength; }

        // All kinds but LengthMismatch
        constexpr std::size_t getPosition() const { return _position; }
        constexpr char getCharacter() const { return _character; }

        // InvalidHexDigit only
        constexpr std::size_t getDigitIndex() const { return _digitIndex; }

        constexpr bool operator==(const ParseError&) const = default;

    private:
        constexpr explicit ParseError(ParseErrorKind kind, std::size_t position = 0, char character = '\0')
            : _kind{ kind }
            , _position{ position }
            , _character{ character }
        {
        }

        ParseErrorKind _kind;
        std::size_t _position{};
        char _character{};
        std::size_t _expectedLength{};
        std::size_t _actualLength{};
        std::size_t _digitIndex{};
    };

    std::string toString(const ParseError& error);
    std::ostream& operator<<(std::ostream& os, const ParseError& error);
} // namespace guidkit::guid
