// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/HeaderMap.hxx"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

/**
 * The conditional request headers which are honoured by the
 * responder.
 */
struct CacheConditions {
	/**
	 * From "If-Modified-Since"; the default value means the
	 * header was not present.
	 */
	std::chrono::system_clock::time_point if_modified_since{};

	/**
	 * The tags listed in "If-None-Match".
	 */
	std::vector<std::string> etags;

	[[gnu::pure]]
	bool MatchesETag(std::string_view etag) const noexcept;
};

/**
 * Split an "If-None-Match" value into its tags.  A "W/" at the
 * beginning of the value applies to all tags.
 */
std::vector<std::string>
ParseETagList(std::string_view value);

/**
 * Throws std::invalid_argument if "If-Modified-Since" is malformed.
 */
CacheConditions
ParseCacheConditions(const HttpHeaderMap &headers);
