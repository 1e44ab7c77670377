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
#include <compare>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "core/String.hpp"

namespace guidkit::guid
{
    // 128-bit identifier, laid out as the Windows GUID record
    class Guid
    {
    public:
        using Data4 = std::array<std::uint8_t, 8>;
        using Bytes = std::array<std::uint8_t, 16>;

        // nil GUID
        constexpr Guid() = default;
        constexpr Guid(std::uint32_t data1, std::uint16_t data2, std::uint16_t data3, const Data4& data4)
            : _data1{ data1 }
            , _data2{ data2 }
            , _data3{ data3 }
            , _data4{ data4 }
        {
        }

        // Only accepts the canonical form "{XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX}", case insensitive
        static std::optional<Guid> fromString(std::string_view str);
        // Throws ParseException
        static Guid parse(std::string_view str);

        constexpr std::uint32_t getData1() const { return _data1; }
        constexpr std::uint16_t getData2() const { return _data2; }
        constexpr std::uint16_t getData3() const { return _data3; }
        constexpr const Data4& getData4() const { return _data4; }

        constexpr bool isNil() const { return *this == Guid{}; }

        // data1, data2 and data3 in big endian order, then data4
        constexpr Bytes toBytes() const
        {
            return Bytes{
                static_cast<std::uint8_t>(_data1 >> 24),
                static_cast<std::uint8_t>(_data1 >> 16),
                static_cast<std::uint8_t>(_data1 >> 8),
                static_cast<std::uint8_t>(_data1),
                static_cast<std::uint8_t>(_data2 >> 8),
                static_cast<std::uint8_t>(_data2),
                static_cast<std::uint8_t>(_data3 >> 8),
                static_cast<std::uint8_t>(_data3),
                _data4[0],
                _data4[1],
                _data4[2],
                _data4[3],
                _data4[4],
                _data4[5],
                _data4[6],
                _data4[7],
            };
        }

        // Canonical form, upper case digits
        std::string toString() const;

        constexpr auto operator<=>(const Guid&) const = default;

    private:
        std::uint32_t _data1{};
        std::uint16_t _data2{};
        std::uint16_t _data3{};
        Data4 _data4{};
    };

    std::ostream& operator<<(std::ostream& os, const Guid& guid);
} // namespace guidkit::guid

namespace std
{
    template<>
    struct hash<guidkit::guid::Guid>
    {
        size_t operator()(const guidkit::guid::Guid& guid) const
        {
            const guidkit::guid::Guid::Bytes bytes{ guid.toBytes() };
            return hash<std::string_view>{}(std::string_view{ reinterpret_cast<const char*>(bytes.data()), bytes.size() });
        }
    };
} // namespace std

namespace guidkit::core::stringUtils
{
    template<>
    [[nodiscard]] std::optional<guid::Guid> readAs(std::string_view str);
}
