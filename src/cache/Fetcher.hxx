// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Logger.hxx"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

class CacheStore;

/**
 * Concatenate an origin URL and a path with exactly one slash
 * between them.
 */
std::string
JoinUrl(std::string_view base, std::string_view path) noexcept;

/**
 * Downloads resources from the origin servers into the
 * #CacheStore.
 */
class CacheFetcher {
	const CacheStore &store;

	const std::vector<std::string> &origins;

	const std::chrono::milliseconds timeout;

	const Logger logger;

public:
	CacheFetcher(const CacheStore &_store,
		     const std::vector<std::string> &_origins,
		     std::chrono::milliseconds _timeout=std::chrono::seconds{60}) noexcept
		:store(_store), origins(_origins), timeout(_timeout),
		 logger("fetcher") {}

	/**
	 * Fetch the resource and store it under the given name.  The
	 * caller must hold an exclusive lock on the entry.
	 *
	 * The origins are tried in order; the first one answering
	 * "200 OK" wins.  The response of the last origin is stored
	 * regardless of its status.  On error, no entry exists
	 * afterwards and the error of the last origin is thrown.
	 *
	 * @param path the path to request from the origins
	 * @return the number of content bytes written
	 */
	uint_least64_t Fetch(std::string_view name, std::string_view path) const;

private:
	/**
	 * Fetch from one origin.
	 *
	 * @param accept_any_status store the response even if the
	 * status is not "200 OK"
	 */
	uint_least64_t FetchFrom(const std::string &url, std::string_view name,
				 bool accept_any_status) const;
};
