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

#include "native/NativeGuid.hpp"

#include <algorithm>
#include <cstring>

namespace guidkit::native
{
    NativeGuid toNativeGuid(const guid::Guid& guid)
    {
        NativeGuid nativeGuid{};
        nativeGuid.Data1 = guid.getData1();
        nativeGuid.Data2 = guid.getData2();
        nativeGuid.Data3 = guid.getData3();
        std::copy(std::cbegin(guid.getData4()), std::cend(guid.getData4()), std::begin(nativeGuid.Data4));

        return nativeGuid;
    }

    guid::Guid fromNativeGuid(const NativeGuid& nativeGuid)
    {
        guid::Guid::Data4 data4;
        std::copy(std::cbegin(nativeGuid.Data4), std::cend(nativeGuid.Data4), std::begin(data4));

        return guid::Guid{ nativeGuid.Data1, nativeGuid.Data2, nativeGuid.Data3, data4 };
    }

    NativeBytes toNativeBytes(const guid::Guid& guid)
    {
        const NativeGuid nativeGuid{ toNativeGuid(guid) };

        NativeBytes bytes;
        std::memcpy(bytes.data(), &nativeGuid, sizeof(nativeGuid));

        return bytes;
    }
} // namespace guidkit::native
