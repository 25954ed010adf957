// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "cache/Conditions.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

TEST(Conditions, ETagList)
{
	EXPECT_TRUE(ParseETagList(""sv).empty());

	auto l = ParseETagList(R"("abc")"sv);
	ASSERT_EQ(l.size(), 1u);
	EXPECT_EQ(l[0], R"("abc")");

	l = ParseETagList(R"( "a" , "b",,"c" )"sv);
	ASSERT_EQ(l.size(), 3u);
	EXPECT_EQ(l[0], R"("a")");
	EXPECT_EQ(l[1], R"("b")");
	EXPECT_EQ(l[2], R"("c")");

	/* a leading weak marker applies to all tags */
	l = ParseETagList(R"(W/"a", "b")"sv);
	ASSERT_EQ(l.size(), 2u);
	EXPECT_EQ(l[0], R"(W/"a")");
	EXPECT_EQ(l[1], R"(W/"b")");
}

TEST(Conditions, Parse)
{
	HttpHeaderMap headers;
	auto c = ParseCacheConditions(headers);
	EXPECT_EQ(c.if_modified_since, std::chrono::system_clock::time_point{});
	EXPECT_TRUE(c.etags.empty());

	headers.emplace("if-modified-since", "Sun, 06 Nov 1994 08:49:37 GMT");
	headers.emplace("if-none-match", R"("x", "y")");
	c = ParseCacheConditions(headers);
	EXPECT_EQ(c.if_modified_since, std::chrono::system_clock::from_time_t(784111777));
	EXPECT_TRUE(c.MatchesETag(R"("y")"sv));
	EXPECT_FALSE(c.MatchesETag(R"("z")"sv));
	EXPECT_FALSE(c.MatchesETag(R"(W/"y")"sv));
}

TEST(Conditions, Malformed)
{
	HttpHeaderMap headers;
	headers.emplace("if-modified-since", "last tuesday");
	EXPECT_THROW(ParseCacheConditions(headers), std::invalid_argument);
}
