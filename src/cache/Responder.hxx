// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Logger.hxx"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

struct HttpServerRequest;
struct CacheConditions;
class HttpResponseWriter;
class CacheStore;

/**
 * Was the entry already cached when the request arrived?
 */
enum class CacheResult {
	HIT,
	MISS,
};

[[gnu::const]]
const char *
ToString(CacheResult result) noexcept;

/**
 * Plain-text bodies replacing the cached body of error responses,
 * indexed by HTTP status.
 */
using CannedReplies = std::map<unsigned, std::string, std::less<>>;

/**
 * Sends a cache entry to the client, honouring conditional requests
 * and byte ranges.
 */
class CacheResponder {
	const CacheStore &store;

	const CannedReplies &canned_replies;

	const Logger logger;

public:
	CacheResponder(const CacheStore &_store,
		       const CannedReplies &_canned_replies) noexcept
		:store(_store), canned_replies(_canned_replies),
		 logger("responder") {}

	/**
	 * Send the entry.  The caller must hold at least a shared
	 * lock on it.
	 *
	 * Throws #InvalidRangeError (before anything has been
	 * written) if the "Range" header cannot be satisfied, and
	 * other exceptions on I/O errors.
	 *
	 * @return the number of body bytes sent
	 */
	uint_least64_t Serve(const HttpServerRequest &request,
			     const CacheConditions &conditions,
			     std::string_view name, CacheResult result,
			     HttpResponseWriter &response) const;

private:
	/**
	 * Mark the entry as used (for the janitor).  Errors are only
	 * logged.
	 */
	void Touch(std::string_view name) const noexcept;
};
