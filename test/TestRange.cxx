// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "cache/Range.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static void
ExpectRange(std::string_view header, uint_least64_t size,
	    uint_least64_t start, uint_least64_t end)
{
	const auto r = ParseRangeHeader(header, size);
	ASSERT_TRUE(r);
	EXPECT_EQ(r->start, start);
	EXPECT_EQ(r->end, end);
}

static std::string
RangeError(std::string_view header, uint_least64_t size)
{
	try {
		ParseRangeHeader(header, size);
	} catch (const InvalidRangeError &e) {
		return e.what();
	}

	return {};
}

TEST(Range, Empty)
{
	EXPECT_FALSE(ParseRangeHeader({}, 1000));
	EXPECT_FALSE(ParseRangeHeader(""sv, 1000));
	EXPECT_FALSE(ParseRangeHeader("  "sv, 1000));
}

TEST(Range, Valid)
{
	ExpectRange("bytes=100-199"sv, 1000, 100, 199);
	EXPECT_EQ(ParseRangeHeader("bytes=100-199"sv, 1000)->GetLength(), 100u);

	ExpectRange("bytes=0-0"sv, 1000, 0, 0);
	ExpectRange("bytes=0-"sv, 1000, 0, 999);
	ExpectRange("bytes=500-"sv, 1000, 500, 999);

	/* the end is clamped */
	ExpectRange("bytes=900-5000"sv, 1000, 900, 999);

	/* suffix ranges */
	ExpectRange("bytes=-100"sv, 1000, 900, 999);
	ExpectRange("bytes=-5000"sv, 1000, 0, 999);
}

TEST(Range, Invalid)
{
	EXPECT_EQ(RangeError("bytes=100"sv, 1000), "invalid range format");
	EXPECT_EQ(RangeError("bytes=1-2-3"sv, 1000), "invalid range format");
	EXPECT_EQ(RangeError("bytes=x-100"sv, 1000), "invalid start value");
	EXPECT_EQ(RangeError("bytes=100-x"sv, 1000), "invalid end value");
	EXPECT_EQ(RangeError("bytes=-x"sv, 1000), "invalid end value");
	EXPECT_EQ(RangeError("bytes=200-100"sv, 1000), "invalid range: start > end");
	EXPECT_EQ(RangeError("bytes=1000-"sv, 1000), "invalid range: start > end");
	EXPECT_EQ(RangeError("bytes=-0"sv, 1000), "invalid range: start > end");
	EXPECT_EQ(RangeError("bytes=0-"sv, 0), "invalid range: start > end");
}
