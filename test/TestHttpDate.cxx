// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/Date.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(HttpDate, Format)
{
	EXPECT_EQ(http_date_format(std::chrono::system_clock::from_time_t(784111777)),
		  "Sun, 06 Nov 1994 08:49:37 GMT");
	EXPECT_EQ(http_date_format(std::chrono::system_clock::from_time_t(0)),
		  "Thu, 01 Jan 1970 00:00:00 GMT");
}

TEST(HttpDate, Parse)
{
	EXPECT_EQ(http_date_parse("Sun, 06 Nov 1994 08:49:37 GMT"sv),
		  std::chrono::system_clock::from_time_t(784111777));

	EXPECT_TRUE(http_date_is_error(http_date_parse(""sv)));
	EXPECT_TRUE(http_date_parse("yesterday"sv) ==
		    std::chrono::system_clock::from_time_t(-1));
	EXPECT_TRUE(http_date_is_error(http_date_parse("Sun, 06 Foo 1994 08:49:37 GMT"sv)));
}
