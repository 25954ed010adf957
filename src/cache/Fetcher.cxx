// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Fetcher.hxx"
#include "Store.hxx"
#include "lib/curl/Adapter.hxx"
#include "lib/curl/Easy.hxx"
#include "lib/curl/Handler.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "http/Date.hxx"
#include "http/Status.hxx"
#include "util/NumberParser.hxx"
#include "media-cache/Version.hxx"

#include <fmt/core.h>

#include <optional>
#include <stdexcept>

using std::string_view_literals::operator""sv;

std::string
JoinUrl(std::string_view base, std::string_view path) noexcept
{
	if (base.ends_with('/'))
		base.remove_suffix(1);
	if (path.starts_with('/'))
		path.remove_prefix(1);

	std::string url;
	url.reserve(base.size() + 1 + path.size());
	url.append(base);
	url.push_back('/');
	url.append(path);
	return url;
}

/**
 * The origin answered with a status other than "200 OK".
 */
class OriginStatusError : public std::runtime_error {
public:
	explicit OriginStatusError(HttpStatus status)
		:std::runtime_error(fmt::format("status {}", unsigned(status))) {}
};

[[gnu::pure]]
static std::string_view
GetHeader(const Curl::Headers &headers, std::string_view name) noexcept
{
	auto i = headers.find(name);
	if (i == headers.end())
		return {};

	return i->second;
}

/**
 * Streams the response body of one origin into a
 * #CacheEntryWriter.
 */
class CacheFetchHandler final : public CurlResponseHandler {
	const CacheStore &store;
	const std::string_view name;
	const bool accept_any_status;

	CacheMetadata metadata;

	/**
	 * The "Content-Length" response header or -1.
	 */
	int_least64_t content_length = -1;

	std::optional<CacheEntryWriter> writer;

	std::exception_ptr error;

public:
	CacheFetchHandler(const CacheStore &_store, std::string_view _name,
			  bool _accept_any_status) noexcept
		:store(_store), name(_name),
		 accept_any_status(_accept_any_status) {}

	void CheckThrowError() {
		if (error) {
			/* delete the partial entry */
			writer.reset();
			std::rethrow_exception(error);
		}
	}

	uint_least64_t Commit(const std::string &url) {
		if (!writer)
			throw std::runtime_error("No response");

		const uint_least64_t n = writer->GetSize();

		metadata.source = url;
		metadata.retrieved = std::chrono::system_clock::now();
		metadata.size = content_length > 0 &&
			uint_least64_t(content_length) == n
			? content_length
			: int_least64_t(n);

		writer->Commit(metadata);
		return n;
	}

	/* virtual methods from class CurlResponseHandler */

	void OnHeaders(HttpStatus status, Curl::Headers &&headers) override {
		if (status != HttpStatus::OK && !accept_any_status)
			throw OriginStatusError(status);

		metadata.status = unsigned(status);
		metadata.content_type = GetHeader(headers, "content-type"sv);
		metadata.etag = GetHeader(headers, "etag"sv);

		if (const auto lm = GetHeader(headers, "last-modified"sv);
		    !lm.empty()) {
			metadata.last_modified = http_date_parse(lm);
			if (http_date_is_error(metadata.last_modified))
				throw FmtRuntimeError("Malformed Last-Modified header: {}",
						      lm);
		}

		if (const auto cl = GetHeader(headers, "content-length"sv);
		    !cl.empty())
			content_length = ParseInteger<int_least64_t>(cl).value_or(-1);

		writer.emplace(store, name);
	}

	void OnData(std::span<const std::byte> data) override {
		writer->Append(data);
	}

	void OnEnd() override {
	}

	void OnError(std::exception_ptr e) noexcept override {
		error = std::move(e);
	}
};

uint_least64_t
CacheFetcher::FetchFrom(const std::string &url, std::string_view name,
			bool accept_any_status) const
{
	CacheFetchHandler handler{store, name, accept_any_status};
	CurlResponseHandlerAdapter adapter{handler};

	CurlEasy easy{url.c_str()};
	easy.SetNoSignal();
	easy.SetFollowLocation();
	easy.SetTimeout(timeout);
	easy.SetUserAgent(MEDIA_CACHE_SOFTWARE "/" MEDIA_CACHE_VERSION);
	adapter.Install(easy);

	adapter.Done(easy.Perform());

	handler.CheckThrowError();
	return handler.Commit(url);
}

uint_least64_t
CacheFetcher::Fetch(std::string_view name, std::string_view path) const
{
	if (origins.empty())
		throw std::runtime_error("No origin configured");

	for (std::size_t i = 0;; ++i) {
		const bool last = i + 1 == origins.size();
		const auto url = JoinUrl(origins[i], path);

		try {
			const auto n = FetchFrom(url, name, last);
			logger(3, "fetched ", url, " (", n, " bytes)");
			return n;
		} catch (...) {
			if (last) {
				store.Remove(name);
				std::throw_with_nested(FmtRuntimeError("Failed to fetch {}",
								       url));
			}

			logger(2, "url ", url, ": ", std::current_exception());
		}
	}
}
