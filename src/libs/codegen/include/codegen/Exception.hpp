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

#include "core/Exception.hpp"

namespace guidkit::codegen
{
    class Exception : public core::GuidkitException
    {
    public:
        using GuidkitException::GuidkitException;
    };
} // namespace guidkit::codegen
