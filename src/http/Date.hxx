// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Formatting and parsing of RFC 1123 dates ("IMF-fixdate"),
 * e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

/**
 * Format the time stamp into the given buffer, which must be at least
 * 30 bytes large.  The result is null-terminated.
 */
void
http_date_format_r(char *buffer, std::chrono::system_clock::time_point t) noexcept;

std::string
http_date_format(std::chrono::system_clock::time_point t) noexcept;

/**
 * Parse a RFC 1123 date.
 *
 * @return the time point or std::chrono::system_clock::from_time_t(-1)
 * on error
 */
[[gnu::pure]]
std::chrono::system_clock::time_point
http_date_parse(std::string_view p) noexcept;

[[gnu::const]]
static inline bool
http_date_is_error(std::chrono::system_clock::time_point t) noexcept
{
	return t == std::chrono::system_clock::from_time_t(-1);
}
