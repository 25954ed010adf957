// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

enum class HttpStatus : uint_least16_t {
	OK = 200,
	PARTIAL_CONTENT = 206,

	NOT_MODIFIED = 304,

	BAD_REQUEST = 400,
	FORBIDDEN = 403,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	REQUEST_TIMEOUT = 408,
	REQUEST_HEADER_FIELDS_TOO_LARGE = 431,

	INTERNAL_SERVER_ERROR = 500,
	NOT_IMPLEMENTED = 501,
	BAD_GATEWAY = 502,
	SERVICE_UNAVAILABLE = 503,
	GATEWAY_TIMEOUT = 504,
	HTTP_VERSION_NOT_SUPPORTED = 505,
};

constexpr bool
http_status_is_valid(HttpStatus status) noexcept
{
	return (unsigned)status >= 100 && (unsigned)status < 600;
}

constexpr bool
http_status_is_success(HttpStatus status) noexcept
{
	return (unsigned)status >= 200 && (unsigned)status < 300;
}

/**
 * Is a response with this status forbidden to carry a body?
 */
constexpr bool
http_status_is_empty(HttpStatus status) noexcept
{
	return status == HttpStatus::NOT_MODIFIED ||
		((unsigned)status >= 100 && (unsigned)status < 200) ||
		(unsigned)status == 204;
}

/**
 * Returns the reason phrase for the status, or nullptr if the status
 * is unknown.
 */
[[gnu::const]]
const char *
http_status_to_string(HttpStatus status) noexcept;
