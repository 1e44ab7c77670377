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

// Generated at build time from data/TestGuids.conf
#include "TestGuids.hpp"

namespace guidkit::codegen::tests
{
    using namespace guid::literals;

    TEST(EmbeddedGuids, constants)
    {
        static_assert(embedded::referenceGuid == "{6B29FC40-CA47-1067-B31D-00DD010662DA}"_guid);
        static_assert(embedded::mixedCaseGuid == "{CAFEF00D-CAFE-F00D-BEEF-1234ABCDDADA}"_guid);
        static_assert(embedded::nilGuid.isNil());

        EXPECT_EQ(embedded::referenceGuid, guid::Guid::parse("{6B29FC40-CA47-1067-B31D-00DD010662DA}"));
        EXPECT_EQ(embedded::mixedCaseGuid.toString(), "{CAFEF00D-CAFE-F00D-BEEF-1234ABCDDADA}");
    }
} // namespace guidkit::codegen::tests
