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

#include <string_view>

#include "core/Exception.hpp"
#include "guid/ParseError.hpp"

namespace guidkit::guid
{
    class Exception : public core::GuidkitException
    {
    public:
        using GuidkitException::GuidkitException;
    };

    class ParseException : public Exception
    {
    public:
        ParseException(std::string_view input, const ParseError& error);

        const ParseError& getError() const { return _error; }

    private:
        ParseError _error;
    };
} // namespace guidkit::guid
