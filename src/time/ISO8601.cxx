// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ISO8601.hxx"
#include "util/CharUtil.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <time.h>

using std::string_view_literals::operator""sv;

static constexpr std::string_view zero_time = "0001-01-01T00:00:00Z"sv;

std::string
FormatISO8601(std::chrono::system_clock::time_point tp)
{
	if (tp == std::chrono::system_clock::time_point{})
		return std::string{zero_time};

	const auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
	const auto nanoseconds =
		std::chrono::duration_cast<std::chrono::nanoseconds>(tp - seconds).count();

	const time_t t = std::chrono::system_clock::to_time_t(seconds);
	struct tm tm;
	if (gmtime_r(&t, &tm) == nullptr)
		throw std::invalid_argument{"Time stamp out of range"};

	std::string result = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
					 tm.tm_year + 1900, tm.tm_mon + 1,
					 tm.tm_mday, tm.tm_hour,
					 tm.tm_min, tm.tm_sec);

	if (nanoseconds > 0) {
		std::string fraction = fmt::format("{:09}", nanoseconds);
		while (fraction.back() == '0')
			fraction.pop_back();

		result.push_back('.');
		result.append(fraction);
	}

	result.push_back('Z');
	return result;
}

static unsigned
ParseDigits(std::string_view &s, std::size_t n)
{
	if (s.size() < n)
		throw std::invalid_argument{"Time stamp too short"};

	unsigned value = 0;
	for (std::size_t i = 0; i < n; ++i) {
		if (!IsDigitASCII(s[i]))
			throw std::invalid_argument{"Digit expected"};
		value = value * 10 + unsigned(s[i] - '0');
	}

	s.remove_prefix(n);
	return value;
}

static void
Expect(std::string_view &s, char ch)
{
	if (s.empty() || s.front() != ch)
		throw std::invalid_argument{fmt::format("'{}' expected", ch)};

	s.remove_prefix(1);
}

std::chrono::system_clock::time_point
ParseISO8601(std::string_view s)
{
	struct tm tm{};
	tm.tm_year = int(ParseDigits(s, 4)) - 1900;
	Expect(s, '-');
	tm.tm_mon = int(ParseDigits(s, 2)) - 1;
	Expect(s, '-');
	tm.tm_mday = ParseDigits(s, 2);

	if (s.empty() || (s.front() != 'T' && s.front() != 't'))
		throw std::invalid_argument{"'T' expected"};
	s.remove_prefix(1);

	tm.tm_hour = ParseDigits(s, 2);
	Expect(s, ':');
	tm.tm_min = ParseDigits(s, 2);
	Expect(s, ':');
	tm.tm_sec = ParseDigits(s, 2);

	if (tm.tm_mon < 0 || tm.tm_mon > 11 ||
	    tm.tm_mday < 1 || tm.tm_mday > 31 ||
	    tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
		throw std::invalid_argument{"Time stamp out of range"};

	std::chrono::nanoseconds fraction{};
	if (!s.empty() && s.front() == '.') {
		s.remove_prefix(1);

		unsigned n = 0;
		long long value = 0;
		while (!s.empty() && IsDigitASCII(s.front())) {
			if (n < 9) {
				value = value * 10 + (s.front() - '0');
				++n;
			}

			s.remove_prefix(1);
		}

		if (n == 0)
			throw std::invalid_argument{"Digit expected"};

		for (; n < 9; ++n)
			value *= 10;

		fraction = std::chrono::nanoseconds{value};
	}

	std::chrono::seconds offset{};
	if (!s.empty() && (s.front() == 'Z' || s.front() == 'z')) {
		s.remove_prefix(1);
	} else if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
		const bool negative = s.front() == '-';
		s.remove_prefix(1);

		const unsigned hours = ParseDigits(s, 2);
		Expect(s, ':');
		const unsigned minutes = ParseDigits(s, 2);

		offset = std::chrono::hours{hours} + std::chrono::minutes{minutes};
		if (negative)
			offset = -offset;
	} else
		throw std::invalid_argument{"Zone designator expected"};

	if (!s.empty())
		throw std::invalid_argument{"Garbage after time stamp"};

	if (tm.tm_year + 1900 < 1678)
		/* this includes the "zero" time; anything this old
		   cannot be represented by std::chrono::system_clock
		   anyway */
		return {};

	const time_t t = timegm(&tm);
	return std::chrono::system_clock::from_time_t(t) - offset +
		std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}
