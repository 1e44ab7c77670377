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

#include <gtest/gtest.h>

#include "guid/GuidLiteral.hpp"

namespace guidkit::guid::tests
{
    using namespace guid::literals;

    namespace
    {
        constexpr Guid interfaceGuid{ "{6B29FC40-CA47-1067-B31D-00DD010662DA}"_guid };
    }

    TEST(GuidLiteral, compileTime)
    {
        static_assert(interfaceGuid.getData1() == 0x6B29FC40);
        static_assert(interfaceGuid.getData2() == 0xCA47);
        static_assert(interfaceGuid.getData3() == 0x1067);
        static_assert(interfaceGuid.getData4() == Guid::Data4{ 0xB3, 0x1D, 0x00, 0xDD, 0x01, 0x06, 0x62, 0xDA });

        static_assert("{6b29fc40-ca47-1067-b31d-00dd010662da}"_guid == interfaceGuid);
        static_assert("{00000000-0000-0000-0000-000000000000}"_guid.isNil());
    }

    TEST(GuidLiteral, sameAsRuntime)
    {
        constexpr Guid literal{ "{cafef00d-CAFE-f00d-BEEF-1234abcdDADA}"_guid };

        const std::string text{ "{cafef00d-CAFE-f00d-BEEF-1234abcdDADA}" };
        EXPECT_EQ(literal, Guid::parse(text));
        EXPECT_EQ(interfaceGuid.toString(), "{6B29FC40-CA47-1067-B31D-00DD010662DA}");
    }
} // namespace guidkit::guid::tests
