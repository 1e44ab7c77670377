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

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "guid/Guid.hpp"

namespace guidkit::native
{
    // Same memory layout as the Windows GUID record (guiddef.h)
    struct NativeGuid
    {
        std::uint32_t Data1;
        std::uint16_t Data2;
        std::uint16_t Data3;
        std::uint8_t Data4[8];
    };
    static_assert(sizeof(NativeGuid) == 16);
    static_assert(std::is_standard_layout_v<NativeGuid> && std::is_trivially_copyable_v<NativeGuid>);
    static_assert(offsetof(NativeGuid, Data2) == 4 && offsetof(NativeGuid, Data3) == 6 && offsetof(NativeGuid, Data4) == 8);

    NativeGuid toNativeGuid(const guid::Guid& guid);
    guid::Guid fromNativeGuid(const NativeGuid& nativeGuid);

    // In memory image of the native record: Data1, Data2 and Data3 use the host byte order
    using NativeBytes = std::array<std::uint8_t, sizeof(NativeGuid)>;
    NativeBytes toNativeBytes(const guid::Guid& guid);
} // namespace guidkit::native
