// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <array>

using std::string_view_literals::operator""sv;

TEST(SpanCast, AsBytes)
{
	const auto s = "ab\0c"sv;
	const auto b = AsBytes(s);
	ASSERT_EQ(b.size(), 4u);
	EXPECT_EQ(b.data(), (const std::byte *)s.data());
	EXPECT_EQ(b[0], std::byte{'a'});
	EXPECT_EQ(b[2], std::byte{0});
}

TEST(SpanCast, ToStringView)
{
	const std::array<std::byte, 3> buffer{std::byte{'x'}, std::byte{'y'}, std::byte{'z'}};
	EXPECT_EQ(ToStringView(buffer), "xyz"sv);
	EXPECT_EQ(ToStringView(std::span{buffer}.first(1)), "x"sv);
	EXPECT_TRUE(ToStringView(std::span<const std::byte>{}).empty());
}
