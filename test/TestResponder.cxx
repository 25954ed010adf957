// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "RecordingResponseWriter.hxx"
#include "cache/Conditions.hxx"
#include "cache/Range.hxx"
#include "cache/Responder.hxx"
#include "cache/Store.hxx"
#include "http_server/Request.hxx"
#include "http/Date.hxx"
#include "system/Error.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

namespace {

struct ResponderTest : ::testing::Test {
	const TempDirectory dir;
	const CacheStore store{dir.GetPath()};
	CannedReplies canned_replies;
	const CacheResponder responder{store, canned_replies};

	std::string content;

	ResponderTest() {
		for (unsigned i = 0; i < 1000; ++i)
			content.push_back(char('a' + i % 26));

		CacheMetadata m;
		m.source = "http://origin/foo.bin";
		m.content_type = "application/octet-stream";
		m.last_modified = std::chrono::system_clock::from_time_t(784111777);
		m.retrieved = std::chrono::system_clock::from_time_t(1700000000);
		m.etag = R"("v1")";
		m.size = content.size();
		store.Write("foo"sv, m, AsBytes(content));
	}

	void WriteError(std::string_view name, unsigned status,
			std::string_view body) {
		CacheMetadata m;
		m.source = "http://origin/error";
		m.status = status;
		m.content_type = "text/html";
		m.retrieved = std::chrono::system_clock::now();
		m.size = body.size();
		store.Write(name, m, AsBytes(body));
	}

	uint_least64_t Serve(const HttpServerRequest &request,
			     RecordingResponseWriter &response,
			     std::string_view name="foo"sv,
			     CacheResult result=CacheResult::HIT) {
		return responder.Serve(request,
				       ParseCacheConditions(request.headers),
				       name, result, response);
	}
};

HttpServerRequest
MakeRequest(HttpMethod method=HttpMethod::GET)
{
	HttpServerRequest request;
	request.method = method;
	request.uri = "/foo.bin";
	return request;
}

} // anonymous namespace

TEST_F(ResponderTest, Full)
{
	RecordingResponseWriter response;
	EXPECT_EQ(Serve(MakeRequest(), response), 1000u);

	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.body, content);
	EXPECT_EQ(response.GetHeader("Content-Length"sv), "1000");
	EXPECT_EQ(response.GetHeader("Content-Type"sv), "application/octet-stream");
	EXPECT_EQ(response.GetHeader("ETag"sv), R"("v1")");
	EXPECT_EQ(response.GetHeader("Last-Modified"sv),
		  "Sun, 06 Nov 1994 08:49:37 GMT");
	EXPECT_EQ(response.GetHeader("Expires"sv),
		  "Thu, 14 Nov 2024 22:13:20 GMT");
	EXPECT_EQ(response.GetHeader("Cache-Control"sv), "max-age=31536000");
	EXPECT_EQ(response.GetHeader("Pragma"sv), "cache");
	EXPECT_EQ(response.GetHeader("Accept-Ranges"sv), "bytes");
	EXPECT_EQ(response.GetHeader("X-Cache"sv), "MediaCache 1.0; HIT");

	RecordingResponseWriter miss;
	Serve(MakeRequest(), miss, "foo"sv, CacheResult::MISS);
	EXPECT_EQ(miss.GetHeader("X-Cache"sv), "MediaCache 1.0; MISS");
}

TEST_F(ResponderTest, Head)
{
	RecordingResponseWriter response;
	EXPECT_EQ(Serve(MakeRequest(HttpMethod::HEAD), response), 0u);

	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_TRUE(response.body.empty());
	EXPECT_EQ(response.GetHeader("Content-Length"sv), "1000");
}

TEST_F(ResponderTest, Range)
{
	auto request = MakeRequest();
	request.headers.emplace("range", "bytes=100-199");

	RecordingResponseWriter response;
	EXPECT_EQ(Serve(request, response), 100u);

	EXPECT_EQ(response.status, HttpStatus::PARTIAL_CONTENT);
	EXPECT_EQ(response.GetHeader("Content-Range"sv), "bytes 100-199/1000");
	EXPECT_EQ(response.GetHeader("Content-Length"sv), "100");
	EXPECT_EQ(response.body, content.substr(100, 100));
}

TEST_F(ResponderTest, SuffixRange)
{
	auto request = MakeRequest();
	request.headers.emplace("range", "bytes=-10");

	RecordingResponseWriter response;
	EXPECT_EQ(Serve(request, response), 10u);
	EXPECT_EQ(response.GetHeader("Content-Range"sv), "bytes 990-999/1000");
	EXPECT_EQ(response.body, content.substr(990));
}

TEST_F(ResponderTest, InvalidRange)
{
	auto request = MakeRequest();
	request.headers.emplace("range", "bytes=500-100");

	RecordingResponseWriter response;
	EXPECT_THROW(Serve(request, response), InvalidRangeError);
	EXPECT_FALSE(response.IsHeadCommitted());
}

TEST_F(ResponderTest, ETag)
{
	auto request = MakeRequest();
	request.headers.emplace("if-none-match", R"("v0", "v1")");

	RecordingResponseWriter response;
	EXPECT_EQ(Serve(request, response), 0u);
	EXPECT_EQ(response.status, HttpStatus::NOT_MODIFIED);
	EXPECT_TRUE(response.body.empty());
	EXPECT_EQ(response.GetHeader("ETag"sv), R"("v1")");
	EXPECT_EQ(response.GetHeader("X-Cache"sv), "MediaCache 1.0; HIT");

	request.headers.clear();
	request.headers.emplace("if-none-match", R"("v2")");

	RecordingResponseWriter response2;
	EXPECT_EQ(Serve(request, response2), 1000u);
	EXPECT_EQ(response2.status, HttpStatus::OK);
}

TEST_F(ResponderTest, IfModifiedSince)
{
	/* after Last-Modified */
	auto request = MakeRequest();
	request.headers.emplace("if-modified-since",
				"Mon, 07 Nov 1994 08:49:37 GMT");

	RecordingResponseWriter response;
	EXPECT_EQ(Serve(request, response), 0u);
	EXPECT_EQ(response.status, HttpStatus::NOT_MODIFIED);

	/* exactly Last-Modified is not enough */
	request.headers.clear();
	request.headers.emplace("if-modified-since",
				"Sun, 06 Nov 1994 08:49:37 GMT");

	RecordingResponseWriter response2;
	Serve(request, response2);
	EXPECT_EQ(response2.status, HttpStatus::OK);
}

TEST_F(ResponderTest, ErrorReplay)
{
	WriteError("error"sv, 404, "<h1>gone</h1>"sv);

	RecordingResponseWriter response;
	EXPECT_EQ(Serve(MakeRequest(), response, "error"sv), 13u);
	EXPECT_EQ(response.status, HttpStatus::NOT_FOUND);
	EXPECT_EQ(response.body, "<h1>gone</h1>");
	EXPECT_EQ(response.GetHeader("Content-Type"sv), "text/html");
	EXPECT_EQ(response.GetHeader("X-Cache"sv), "MediaCache 1.0; HIT");

	/* conditions and ranges do not apply */
	auto request = MakeRequest();
	request.headers.emplace("range", "bytes=0-1");
	RecordingResponseWriter response2;
	Serve(request, response2, "error"sv);
	EXPECT_EQ(response2.status, HttpStatus::NOT_FOUND);
	EXPECT_EQ(response2.body, "<h1>gone</h1>");
}

TEST_F(ResponderTest, CannedReply)
{
	WriteError("error"sv, 404, "<h1>gone</h1>"sv);
	canned_replies.emplace(404, "no such file");

	RecordingResponseWriter response;
	EXPECT_EQ(Serve(MakeRequest(), response, "error"sv), 12u);
	EXPECT_EQ(response.status, HttpStatus::NOT_FOUND);
	EXPECT_EQ(response.body, "no such file");
	EXPECT_EQ(response.GetHeader("Content-Type"sv),
		  "text/plain; charset=utf-8");
}

TEST_F(ResponderTest, Missing)
{
	RecordingResponseWriter response;
	try {
		Serve(MakeRequest(), response, "missing"sv);
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsFileNotFound(e));
	}

	EXPECT_FALSE(response.IsHeadCommitted());
}
