// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/HeaderMap.hxx"
#include "http/Method.hxx"
#include "util/StringSplit.hxx"

#include <string>
#include <string_view>

/**
 * An incoming HTTP request (without body).
 */
struct HttpServerRequest {
	HttpMethod method = HttpMethod::UNDEFINED;

	/**
	 * The raw request target, i.e. path and query string.
	 */
	std::string uri;

	HttpHeaderMap headers;

	[[gnu::pure]]
	std::string_view GetPath() const noexcept {
		return Split(std::string_view{uri}, '?').first;
	}

	/**
	 * Returns the query string without the question mark, or a
	 * nulled std::string_view if there is none.
	 */
	[[gnu::pure]]
	std::string_view GetQueryString() const noexcept {
		return Split(std::string_view{uri}, '?').second;
	}

	[[gnu::pure]]
	std::string_view GetHeader(std::string_view name) const noexcept {
		return ::GetHeader(headers, name);
	}
};
