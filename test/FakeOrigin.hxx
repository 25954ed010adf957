// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http_server/Handler.hxx"
#include "http_server/Server.hxx"
#include "http/Status.hxx"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * An origin server for unit tests, listening on a random port on the
 * loopback interface.  It serves canned resources and counts the
 * requests it receives.
 */
class FakeOrigin final : public HttpServerRequestHandler {
public:
	struct Resource {
		HttpStatus status = HttpStatus::OK;
		std::string body;
		std::vector<std::pair<std::string, std::string>> headers;

		/**
		 * Wait this long before responding.
		 */
		std::chrono::milliseconds delay{};
	};

private:
	mutable std::mutex mutex;
	std::map<std::string, Resource, std::less<>> resources;

	std::atomic_uint n_requests{0};

	HttpServer server;

public:
	FakeOrigin();
	~FakeOrigin() noexcept;

	/**
	 * Add or replace a resource.  Unknown paths answer "404 Not
	 * Found".
	 */
	void Set(std::string_view path, Resource resource);

	void Set(std::string_view path, std::string_view body) {
		Resource r;
		r.body = body;
		Set(path, std::move(r));
	}

	unsigned GetRequestCount() const noexcept {
		return n_requests.load();
	}

	/**
	 * The base URL, e.g. "http://127.0.0.1:12345".
	 */
	std::string GetUrl() const;

	/* virtual methods from class HttpServerRequestHandler */
	void HandleHttpRequest(const HttpServerRequest &request,
			       HttpResponseWriter &response) override;
};
