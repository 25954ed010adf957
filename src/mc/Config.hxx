// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "cache/Janitor.hxx"
#include "cache/Key.hxx"
#include "cache/Responder.hxx"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

/**
 * Configuration of the media-cache daemon.  It is loaded from
 * environment variables (CACHE_*).
 */
struct McConfig {
	/**
	 * The listener address, "[host]:port".
	 */
	std::string listen = ":3333";

	std::string cache_dir = "./cache";

	/**
	 * The origin servers in the order they are tried.
	 */
	std::vector<std::string> upstreams{"https://example.com"};

	CacheKeyOptions key;

	/**
	 * Replacement bodies for cached 403/404/500/503/504
	 * responses.
	 */
	CannedReplies canned_replies;

	JanitorConfig janitor;

	/**
	 * The number of request worker threads.
	 */
	unsigned workers = 64;

	std::chrono::milliseconds fetch_timeout = std::chrono::seconds{60};
};

/**
 * Returns the value of an environment variable or nullptr if it is
 * not set.
 */
using EnvironmentLookup = std::function<const char *(const char *name)>;

/**
 * Apply the environment variables to the configuration.  Variables
 * which are not set leave the defaults untouched.
 *
 * Throws std::runtime_error naming the variable if a value is
 * invalid.
 */
void
LoadEnvironment(McConfig &config, const EnvironmentLookup &getenv);

/**
 * Like LoadEnvironment(), but using the process environment.
 */
void
LoadEnvironment(McConfig &config);

/**
 * Parse a boolean the way the CACHE_* variables accept it ("1", "t",
 * "T", "TRUE", "true", "True" and their negative counterparts).
 *
 * Throws std::invalid_argument on error.
 */
bool
ParseBool(std::string_view s);

/**
 * Throws std::runtime_error on invalid values.
 */
void
Check(const McConfig &config);
