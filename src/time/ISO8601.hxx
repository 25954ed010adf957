// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * RFC 3339 (a profile of ISO 8601) time stamps as used in the cache
 * metadata files, e.g. "2024-03-01T12:30:05.25Z".
 *
 * The default-constructed time_point is the "zero" time and is
 * represented as "0001-01-01T00:00:00Z".
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

/**
 * Format the time stamp in UTC, with fractional seconds only if
 * there are any.
 */
std::string
FormatISO8601(std::chrono::system_clock::time_point tp);

/**
 * Parse a RFC 3339 time stamp with an optional fraction and a "Z"
 * or numeric zone designator.
 *
 * Throws std::invalid_argument on error.
 */
std::chrono::system_clock::time_point
ParseISO8601(std::string_view s);
