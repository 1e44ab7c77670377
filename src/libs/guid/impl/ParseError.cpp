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

#include "guid/ParseError.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace guidkit::guid
{
    namespace
    {
        struct QuotedCharacter
        {
            char c;
        };

        std::ostream& operator<<(std::ostream& os, QuotedCharacter character)
        {
            const auto value{ static_cast<unsigned char>(character.c) };
            if (value >= 0x20 && value < 0x7F)
                os << '\'' << character.c << '\'';
            else
                os << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<unsigned>(value) << std::dec << std::nouppercase;

            return os;
        }
    } // namespace

    const char* getParseErrorKindName(ParseErrorKind kind)
    {
        switch (kind)
        {
        case ParseErrorKind::LengthMismatch:
            return "LengthMismatch";
        case ParseErrorKind::MissingOpenBrace:
            return "MissingOpenBrace";
        case ParseErrorKind::MissingCloseBrace:
            return "MissingCloseBrace";
        case ParseErrorKind::MissingSeparator:
            return "MissingSeparator";
        case ParseErrorKind::InvalidHexDigit:
            return "InvalidHexDigit";
        }
        return "";
    }

    std::string toString(const ParseError& error)
    {
        std::ostringstream oss;
        oss << error;
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const ParseError& error)
    {
        switch (error.getKind())
        {
        case ParseErrorKind::LengthMismatch:
            os << "expected " << error.getExpectedLength() << " characters, got " << error.getActualLength();
            break;
        case ParseErrorKind::MissingOpenBrace:
            os << "expected '{' at position " << error.getPosition() << ", got " << QuotedCharacter{ error.getCharacter() };
            break;
        case ParseErrorKind::MissingCloseBrace:
            os << "expected '}' at position " << error.getPosition() << ", got " << QuotedCharacter{ error.getCharacter() };
            break;
        case ParseErrorKind::MissingSeparator:
            os << "expected '-' at position " << error.getPosition() << ", got " << QuotedCharacter{ error.getCharacter() };
            break;
        case ParseErrorKind::InvalidHexDigit:
            os << "invalid hex digit " << QuotedCharacter{ error.getCharacter() } << " at position " << error.getPosition() << " (digit " << error.getDigitIndex() << ")";
            break;
        }

        return os;
    }
} // namespace guidkit::guid
