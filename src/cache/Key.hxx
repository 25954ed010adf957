// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * How request URIs are mapped to cache entries.
 */
struct CacheKeyOptions {
	/**
	 * This prefix is required on all request paths and is
	 * stripped from them.
	 */
	std::string prefix = "/";

	/**
	 * Include the query string in the key?
	 */
	bool key_query = true;

	/**
	 * Use the SHA-256 of the key as file name?  If false, the key
	 * is the file name.
	 */
	bool hash_keys = true;
};

/**
 * A request URI mapped to the cache.
 */
struct CacheKey {
	/**
	 * The decoded path with the prefix stripped, plus "?query"
	 * if enabled.  Used for locking and statistics.
	 */
	std::string key;

	/**
	 * The file name in the cache directory.
	 */
	std::string name;

	/**
	 * The (still escaped) path with the prefix stripped, without
	 * query string.  This is requested from the origins.
	 */
	std::string fetch_path;
};

/**
 * Does the key contain a forbidden sequence?
 */
[[gnu::pure]]
bool
IsValidCacheKey(std::string_view key, bool hash_keys) noexcept;

/**
 * Map a key to a file name in the cache directory.
 */
[[gnu::pure]]
std::string
CacheKeyToFileName(std::string_view key, bool hash_keys) noexcept;

/**
 * Map a request to a #CacheKey.
 *
 * @param path the raw (escaped) request path
 * @param query the raw query string; a nulled or empty value means
 * there is none
 * @return std::nullopt if the path is not acceptable (missing
 * prefix, malformed escape, forbidden characters)
 */
std::optional<CacheKey>
MakeCacheKey(std::string_view path, std::string_view query,
	     const CacheKeyOptions &options);
