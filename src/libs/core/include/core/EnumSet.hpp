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

#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <type_traits>

namespace guidkit::core
{
    // Set of enum values stored as a bitfield, usable in constant expressions
    template<typename T, typename UnderlyingType = std::uint32_t>
    class EnumSet
    {
        static_assert(std::is_enum_v<T>);
        static_assert(std::is_unsigned_v<UnderlyingType>);

    public:
        constexpr EnumSet() = default;
        constexpr EnumSet(std::initializer_list<T> values)
        {
            for (T value : values)
                insert(value);
        }

        constexpr void insert(T value)
        {
            _bitfield |= getMask(value);
        }

        constexpr void erase(T value)
        {
            _bitfield &= ~getMask(value);
        }

        constexpr bool contains(T value) const { return _bitfield & getMask(value); }
        constexpr bool empty() const { return _bitfield == 0; }
        constexpr UnderlyingType getBitfield() const { return _bitfield; }

        constexpr bool operator==(const EnumSet& other) const = default;

    private:
        static constexpr UnderlyingType getMask(T value)
        {
            assert(static_cast<std::size_t>(value) < sizeof(UnderlyingType) * 8);
            return UnderlyingType{ 1 } << static_cast<UnderlyingType>(value);
        }

        UnderlyingType _bitfield{};
    };
} // namespace guidkit::core
