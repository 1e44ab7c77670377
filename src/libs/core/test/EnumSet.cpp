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

#include "core/EnumSet.hpp"

namespace guidkit::core::tests
{
    namespace
    {
        enum class Foo
        {
            One,
            Two,
            Three,
        };
    }

    TEST(EnumSet, ctr)
    {
        {
            constexpr EnumSet<Foo> test;
            static_assert(test.empty());
            static_assert(!test.contains(Foo::One));
        }

        {
            constexpr EnumSet<Foo> test{ Foo::One, Foo::Three };
            static_assert(!test.empty());
            static_assert(test.contains(Foo::One));
            static_assert(!test.contains(Foo::Two));
            static_assert(test.contains(Foo::Three));
            static_assert(test.getBitfield() == 0b101);
        }
    }

    TEST(EnumSet, insertErase)
    {
        EnumSet<Foo> test;
        test.insert(Foo::Two);
        EXPECT_TRUE(test.contains(Foo::Two));
        EXPECT_FALSE(test.contains(Foo::One));

        test.insert(Foo::Two);
        EXPECT_EQ(test, (EnumSet<Foo>{ Foo::Two }));

        test.erase(Foo::Two);
        EXPECT_TRUE(test.empty());
        EXPECT_EQ(test, EnumSet<Foo>{});
    }
} // namespace guidkit::core::tests
