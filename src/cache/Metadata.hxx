// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * The metadata of a cache entry, stored in the ".meta" file next to
 * the content.
 */
struct CacheMetadata {
	/**
	 * The URL the content was fetched from.
	 */
	std::string source;

	/**
	 * The HTTP status of the origin response.
	 */
	unsigned status = 200;

	std::string content_type;

	/**
	 * From the "Last-Modified" response header; the default
	 * value means unknown.
	 */
	std::chrono::system_clock::time_point last_modified{};

	/**
	 * When the content was fetched.
	 */
	std::chrono::system_clock::time_point retrieved{};

	std::string etag;

	/**
	 * The content length in bytes.
	 */
	int_least64_t size = 0;
};

void
to_json(nlohmann::json &j, const CacheMetadata &metadata);

void
from_json(const nlohmann::json &j, CacheMetadata &metadata);

/**
 * Serialize to one line of JSON, terminated by a newline.
 */
std::string
SerializeCacheMetadata(const CacheMetadata &metadata);

/**
 * Parse the contents of a ".meta" file.  Throws on error.
 */
CacheMetadata
ParseCacheMetadata(std::string_view s);
