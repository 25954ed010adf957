// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "cache/Fetcher.hxx"
#include "cache/Janitor.hxx"
#include "cache/Responder.hxx"
#include "cache/Store.hxx"
#include "http_server/Handler.hxx"
#include "io/Logger.hxx"
#include "lock/KeyLockRegistry.hxx"
#include "stats/CacheStats.hxx"

#include <cstdint>

struct CacheKey;
struct CacheConditions;
class KeyLock;

/**
 * The state of the media-cache daemon, and the handler of incoming
 * HTTP requests.
 */
struct McInstance final : HttpServerRequestHandler {
	const McConfig &config;

	const Logger logger;

	CacheStats global_stats{"TOTALS"};

	KeyLockRegistry registry{global_stats};

	const CacheStore store;

	const CacheFetcher fetcher;

	const CacheResponder responder;

	Janitor janitor;

	explicit McInstance(const McConfig &_config) noexcept;

	/* virtual methods from class HttpServerRequestHandler */
	void HandleHttpRequest(const HttpServerRequest &request,
			       HttpResponseWriter &response) override;

private:
	void HandleCacheRequest(const HttpServerRequest &request,
				HttpResponseWriter &response);

	/**
	 * Is there a usable entry?  Caller must hold a lock on it.
	 */
	bool IsFresh(const CacheKey &key) const noexcept;

	/**
	 * Send the entry and update the statistics.  Caller must
	 * hold a shared lock on it.
	 */
	void ServeEntry(const HttpServerRequest &request,
			const CacheConditions &conditions,
			const CacheKey &key, KeyLock &lock,
			CacheResult result,
			HttpResponseWriter &response);
};
