// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Responder.hxx"
#include "Conditions.hxx"
#include "Range.hxx"
#include "Store.hxx"
#include "http_server/Request.hxx"
#include "http_server/ResponseWriter.hxx"
#include "http/Date.hxx"
#include "http/Status.hxx"
#include "system/Error.hxx"
#include "media-cache/Version.hxx"

#include <fmt/core.h>

#include <time.h>

using std::string_view_literals::operator""sv;

const char *
ToString(CacheResult result) noexcept
{
	switch (result) {
	case CacheResult::HIT:
		return "HIT";

	case CacheResult::MISS:
		return "MISS";
	}

	return "?";
}

/**
 * Add one calendar year.
 */
static std::chrono::system_clock::time_point
NextYear(std::chrono::system_clock::time_point t) noexcept
{
	const time_t tt = std::chrono::system_clock::to_time_t(t);
	struct tm tm;
	gmtime_r(&tt, &tm);
	++tm.tm_year;

	/* timegm() normalizes February 29th to March 1st */
	return std::chrono::system_clock::from_time_t(timegm(&tm));
}

static std::string
MakeXCache(CacheResult result)
{
	return fmt::format(MEDIA_CACHE_SOFTWARE " " MEDIA_CACHE_VERSION "; {}",
			   ToString(result));
}

void
CacheResponder::Touch(std::string_view name) const noexcept
{
	try {
		store.Touch(name);
	} catch (const std::system_error &e) {
		/* not fatal; the entry only looks older to the
		   janitor */
		logger(2, "Failed to update usage time: ", e.what());
	}
}

uint_least64_t
CacheResponder::Serve(const HttpServerRequest &request,
		      const CacheConditions &conditions,
		      std::string_view name, CacheResult result,
		      HttpResponseWriter &response) const
{
	auto entry = store.Open(name);
	const auto &metadata = entry.metadata;
	const bool head = request.method == HttpMethod::HEAD;

	if (metadata.status != 200) {
		/* replay the origin's error response */
		const auto status = static_cast<HttpStatus>(metadata.status);

		response.SetHeader("X-Cache"sv, MakeXCache(result));

		if (auto i = canned_replies.find(metadata.status);
		    i != canned_replies.end() && !i->second.empty()) {
			response.SendPlain(status, i->second);
			Touch(name);
			return head ? 0 : i->second.size();
		}

		const off_t size = entry.content.GetSize();
		if (size < 0)
			throw MakeErrno("Failed to stat cached file");

		if (!metadata.content_type.empty())
			response.SetHeader("Content-Type"sv, metadata.content_type);
		response.SetHeader("Content-Length"sv, fmt::format("{}", size));
		response.WriteHead(status);

		if (!head && size > 0)
			response.SendFile(entry.content, 0, size);

		Touch(name);
		return head ? 0 : size;
	}

	if (metadata.last_modified != std::chrono::system_clock::time_point{} &&
	    conditions.if_modified_since != std::chrono::system_clock::time_point{} &&
	    metadata.last_modified < conditions.if_modified_since) {
		response.SetHeader("X-Cache"sv, MakeXCache(result));
		if (!metadata.etag.empty())
			response.SetHeader("ETag"sv, metadata.etag);
		response.WriteHead(HttpStatus::NOT_MODIFIED);
		return 0;
	}

	if (!metadata.etag.empty() && conditions.MatchesETag(metadata.etag)) {
		response.SetHeader("X-Cache"sv, MakeXCache(result));
		response.SetHeader("ETag"sv, metadata.etag);
		response.WriteHead(HttpStatus::NOT_MODIFIED);
		return 0;
	}

	const uint_least64_t size = metadata.size;

	/* throws InvalidRangeError before anything is written */
	const auto range = ParseRangeHeader(request.GetHeader("range"sv),
					    size);

	if (!metadata.content_type.empty())
		response.SetHeader("Content-Type"sv, metadata.content_type);
	if (metadata.last_modified != std::chrono::system_clock::time_point{})
		response.SetHeader("Last-Modified"sv,
				   http_date_format(metadata.last_modified));
	response.SetHeader("Cache-Control"sv, "max-age=31536000"sv);
	response.SetHeader("Pragma"sv, "cache"sv);
	response.SetHeader("Expires"sv,
			   http_date_format(NextYear(metadata.retrieved)));
	if (!metadata.etag.empty())
		response.SetHeader("ETag"sv, metadata.etag);
	response.SetHeader("Accept-Ranges"sv, "bytes"sv);
	response.SetHeader("X-Cache"sv, MakeXCache(result));

	uint_least64_t offset = 0, length = size;

	if (range) {
		offset = range->start;
		length = range->GetLength();

		response.SetHeader("Content-Range"sv,
				   fmt::format("bytes {}-{}/{}",
					       range->start, range->end, size));
		response.SetHeader("Content-Length"sv,
				   fmt::format("{}", length));
		response.WriteHead(HttpStatus::PARTIAL_CONTENT);
	} else {
		response.SetHeader("Content-Length"sv,
				   fmt::format("{}", length));
		response.WriteHead(HttpStatus::OK);
	}

	if (!head && length > 0)
		response.SendFile(entry.content, offset, length);

	Touch(name);
	return head ? 0 : length;
}
