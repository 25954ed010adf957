// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Date.hxx"
#include "util/CharUtil.hxx"

#include <cstring>

#include <time.h>

static constexpr char wdays[8][4] = {
	"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "???",
};

static constexpr char months[13][4] = {
	"Jan", "Feb", "Mar", "Apr", "May", "Jun",
	"Jul", "Aug", "Sep", "Oct", "Nov", "Dec", "???",
};

static constexpr const char *
wday_name(int wday) noexcept
{
	return wdays[wday >= 0 && wday < 7 ? wday : 7];
}

static constexpr const char *
month_name(int month) noexcept
{
	return months[month >= 0 && month < 12 ? month : 12];
}

static char *
format_2digit(char *dest, unsigned value) noexcept
{
	*dest++ = char('0' + (value / 10) % 10);
	*dest++ = char('0' + value % 10);
	return dest;
}

static char *
format_4digit(char *dest, unsigned value) noexcept
{
	*dest++ = char('0' + (value / 1000) % 10);
	*dest++ = char('0' + (value / 100) % 10);
	return format_2digit(dest, value);
}

void
http_date_format_r(char *buffer, std::chrono::system_clock::time_point t) noexcept
{
	const time_t tt = std::chrono::system_clock::to_time_t(t);
	struct tm tm;
	if (gmtime_r(&tt, &tm) == nullptr)
		memset(&tm, 0, sizeof(tm));

	memcpy(buffer, wday_name(tm.tm_wday), 3);
	buffer[3] = ',';
	buffer[4] = ' ';
	format_2digit(buffer + 5, tm.tm_mday);
	buffer[7] = ' ';
	memcpy(buffer + 8, month_name(tm.tm_mon), 3);
	buffer[11] = ' ';
	format_4digit(buffer + 12, tm.tm_year + 1900);
	buffer[16] = ' ';
	format_2digit(buffer + 17, tm.tm_hour);
	buffer[19] = ':';
	format_2digit(buffer + 20, tm.tm_min);
	buffer[22] = ':';
	format_2digit(buffer + 23, tm.tm_sec);
	memcpy(buffer + 25, " GMT", 5);
}

std::string
http_date_format(std::chrono::system_clock::time_point t) noexcept
{
	char buffer[32];
	http_date_format_r(buffer, t);
	return buffer;
}

static int
parse_2digit(const char *p) noexcept
{
	if (!IsDigitASCII(p[0]) || !IsDigitASCII(p[1]))
		return -1;

	return (p[0] - '0') * 10 + (p[1] - '0');
}

static int
parse_4digit(const char *p) noexcept
{
	if (!IsDigitASCII(p[0]) || !IsDigitASCII(p[1]) ||
	    !IsDigitASCII(p[2]) || !IsDigitASCII(p[3]))
		return -1;

	return (p[0] - '0') * 1000 + (p[1] - '0') * 100
		+ (p[2] - '0') * 10 + (p[3] - '0');
}

static int
parse_name(const char *p, const char (*names)[4], unsigned n) noexcept
{
	for (unsigned i = 0; i < n; ++i)
		if (memcmp(names[i], p, 3) == 0)
			return i;

	return -1;
}

std::chrono::system_clock::time_point
http_date_parse(std::string_view s) noexcept
{
	const auto error = std::chrono::system_clock::from_time_t(-1);

	/* "Sun, 06 Nov 1994 08:49:37 GMT" */
	if (s.size() != 29)
		return error;

	const char *p = s.data();
	if (p[3] != ',' || p[4] != ' ' || p[7] != ' ' || p[11] != ' ' ||
	    p[16] != ' ' || p[19] != ':' || p[22] != ':' ||
	    memcmp(p + 25, " GMT", 4) != 0)
		return error;

	struct tm tm{};
	tm.tm_wday = parse_name(p, wdays, 7);
	tm.tm_sec = parse_2digit(p + 23);
	tm.tm_min = parse_2digit(p + 20);
	tm.tm_hour = parse_2digit(p + 17);
	tm.tm_mday = parse_2digit(p + 5);
	tm.tm_mon = parse_name(p + 8, months, 12);
	tm.tm_year = parse_4digit(p + 12);

	if (tm.tm_wday == -1 ||
	    tm.tm_sec < 0 || tm.tm_sec > 60 ||
	    tm.tm_min < 0 || tm.tm_min > 59 ||
	    tm.tm_hour < 0 || tm.tm_hour > 23 ||
	    tm.tm_mday < 1 || tm.tm_mday > 31 ||
	    tm.tm_mon == -1 || tm.tm_year < 1900)
		return error;

	tm.tm_year -= 1900;
	tm.tm_isdst = 0;

	return std::chrono::system_clock::from_time_t(timegm(&tm));
}
