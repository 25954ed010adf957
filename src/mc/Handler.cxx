// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "cache/Conditions.hxx"
#include "cache/Key.hxx"
#include "cache/Range.hxx"
#include "http_server/Request.hxx"
#include "http_server/ResponseWriter.hxx"
#include "http/Status.hxx"
#include "net/SocketProtocolError.hxx"
#include "system/Error.hxx"
#include "util/ScopeExit.hxx"
#include "media-cache/Version.hxx"

#include <fmt/core.h>

#include <mutex>
#include <shared_mutex>

using std::string_view_literals::operator""sv;

bool
McInstance::IsFresh(const CacheKey &key) const noexcept
{
	return store.Exists(key.name) &&
		!store.IsStale(key.name, config.janitor.max_age);
}

void
McInstance::ServeEntry(const HttpServerRequest &request,
		       const CacheConditions &conditions,
		       const CacheKey &key, KeyLock &lock,
		       CacheResult result,
		       HttpResponseWriter &response)
{
	auto &stats = lock.stats;

	try {
		const auto n = responder.Serve(request, conditions, key.name,
					       result, response);
		if (result == CacheResult::HIT)
			stats.Hit(n);
		else
			stats.Miss(n);
	} catch (const InvalidRangeError &e) {
		logger(3, "invalid range for ", key.key, ": ", e.what());
		response.SendPlain(HttpStatus::BAD_REQUEST,
				   fmt::format("Invalid range request: {}",
					       e.what()));
		stats.Error(response.GetBodyBytesSent());
	} catch (const SocketProtocolError &) {
		/* the client went away; this is not our error */
		const auto n = response.GetBodyBytesSent();
		stats.Disconnect();
		if (result == CacheResult::HIT)
			stats.Hit(n);
		else
			stats.Miss(n);
		throw;
	}
}

void
McInstance::HandleCacheRequest(const HttpServerRequest &request,
			       HttpResponseWriter &response)
{
	const auto key = MakeCacheKey(request.GetPath(),
				      request.GetQueryString(),
				      config.key);
	if (!key) {
		logger(2, "error with request for `", request.uri,
		       "`: invalid path");
		response.SendPlain(HttpStatus::BAD_REQUEST, "invalid path"sv);
		global_stats.Error(response.GetBodyBytesSent());
		return;
	}

	const auto lock = registry.Get(key->key);
	auto &stats = lock->stats;

	stats.Requested();
	AtScopeExit(&stats) { stats.Completed(); };

	CacheConditions conditions;
	try {
		conditions = ParseCacheConditions(request.headers);
	} catch (const std::invalid_argument &e) {
		logger(2, "error parsing If-Modified-Since header: ", e.what());
		response.SendPlain(HttpStatus::BAD_REQUEST,
				   "error parsing If-Modified-Since header"sv);
		stats.Error(response.GetBodyBytesSent());
		return;
	}

	try {
		{
			std::shared_lock shared{*lock};

			if (IsFresh(*key)) {
				try {
					ServeEntry(request, conditions, *key, *lock,
						   CacheResult::HIT, response);
					return;
				} catch (const std::system_error &e) {
					/* the janitor may have deleted the
					   entry meanwhile; fetch it again */
					if (!IsFileNotFound(e) ||
					    response.IsHeadCommitted())
						throw;
				}
			}
		}

		{
			const std::scoped_lock exclusive{*lock};

			/* check again; another request may have
			   fetched it while we were waiting */
			if (!IsFresh(*key)) {
				store.Remove(key->name);

				try {
					stats.Received(fetcher.Fetch(key->name,
								     key->fetch_path));
				} catch (...) {
					logger(1, "error fetching file ", key->key, ": ",
					       std::current_exception());
					response.SendPlain(HttpStatus::INTERNAL_SERVER_ERROR,
							   "error fetching file"sv);
					stats.Error(response.GetBodyBytesSent());
					return;
				}
			}
		}

		std::shared_lock shared{*lock};
		ServeEntry(request, conditions, *key, *lock,
			   CacheResult::MISS, response);
	} catch (const SocketProtocolError &) {
		throw;
	} catch (...) {
		logger(1, "error serving file ", key->key, ": ",
		       std::current_exception());
		stats.Error(response.GetBodyBytesSent());

		if (response.IsHeadCommitted())
			/* too late for an error response; let the
			   connection close */
			throw;

		response.SendPlain(HttpStatus::INTERNAL_SERVER_ERROR,
				   "error serving file"sv);
	}
}

void
McInstance::HandleHttpRequest(const HttpServerRequest &request,
			      HttpResponseWriter &response)
{
	if (request.method != HttpMethod::GET &&
	    request.method != HttpMethod::HEAD) {
		response.SetHeader("Allow"sv, "GET, HEAD"sv);
		response.SendPlain(HttpStatus::METHOD_NOT_ALLOWED,
				   "Method not allowed"sv);
		return;
	}

	const auto path = request.GetPath();

	if (path == "/"sv) {
		response.SendPlain(HttpStatus::OK,
				   MEDIA_CACHE_SOFTWARE " " MEDIA_CACHE_VERSION "\n"
				   MEDIA_CACHE_URL "\n"sv);
		return;
	}

	if (path == "/healthz"sv) {
		response.SendPlain(HttpStatus::OK, "OK"sv);
		return;
	}

	HandleCacheRequest(request, response);
}
