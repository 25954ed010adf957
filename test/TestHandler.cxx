// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeOrigin.hxx"
#include "HttpClient.hxx"
#include "TempDirectory.hxx"
#include "RecordingResponseWriter.hxx"
#include "mc/Instance.hxx"
#include "http_server/Request.hxx"
#include "http_server/Server.hxx"
#include "net/ServerSocket.hxx"
#include "net/SocketProtocolError.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/SpanCast.hxx"

#include <fmt/core.h>

#include <gtest/gtest.h>

#include <thread>

using std::string_view_literals::operator""sv;

namespace {

struct HandlerTest : ::testing::Test {
	FakeOrigin origin;
	const TempDirectory dir;
	McConfig config;
	std::string content;

	HandlerTest() {
		for (unsigned i = 0; i < 1000; ++i)
			content.push_back(char('0' + i % 10));

		FakeOrigin::Resource r;
		r.body = content;
		r.headers = {
			{"Content-Type", "image/png"},
			{"ETag", R"("e1")"},
		};
		origin.Set("/media/a.png"sv, std::move(r));

		config.cache_dir = dir.GetPath();
		config.upstreams = {origin.GetUrl() + "/media"};
		config.janitor.print_stats = false;
	}

	static RecordingResponseWriter Get(McInstance &instance,
					   std::string_view uri,
					   HttpHeaderMap headers={},
					   HttpMethod method=HttpMethod::GET) {
		HttpServerRequest request;
		request.method = method;
		request.uri = uri;
		request.headers = std::move(headers);

		RecordingResponseWriter response;
		instance.HandleHttpRequest(request, response);
		return response;
	}

	static CacheStats::Snapshot KeyStats(McInstance &instance,
					     std::string_view key) {
		return instance.registry.Get(key)->stats.GetSnapshot();
	}
};

} // anonymous namespace

TEST_F(HandlerTest, Banner)
{
	McInstance instance{config};

	auto response = Get(instance, "/"sv);
	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.body, "MediaCache 1.0\nhttps://github.com/ShittyKopper/mediacache\n");

	response = Get(instance, "/healthz"sv);
	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.body, "OK");

	EXPECT_EQ(origin.GetRequestCount(), 0u);
}

TEST_F(HandlerTest, ClientDisconnect)
{
	McInstance instance{config};

	HttpServerRequest request;
	request.method = HttpMethod::GET;
	request.uri = "/a.png";

	/* the client goes away during a miss; the entry stays
	   cached */
	RecordingResponseWriter response;
	response.disconnect_after = 300;
	EXPECT_THROW(instance.HandleHttpRequest(request, response),
		     SocketClosedPrematurelyError);
	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.body.size(), 300u);
	EXPECT_EQ(origin.GetRequestCount(), 1u);

	auto s = KeyStats(instance, "a.png"sv);
	EXPECT_EQ(s.requests, 1u);
	EXPECT_EQ(s.completed, 1u);
	EXPECT_EQ(s.disconnects, 1u);
	EXPECT_EQ(s.errors, 0u);
	EXPECT_EQ(s.misses, 1u);
	EXPECT_EQ(s.miss_bytes, 300u);
	EXPECT_EQ(s.hits, 0u);

	/* and during a hit */
	RecordingResponseWriter response2;
	response2.disconnect_after = 500;
	EXPECT_THROW(instance.HandleHttpRequest(request, response2),
		     SocketClosedPrematurelyError);
	EXPECT_EQ(response2.body.size(), 500u);
	EXPECT_EQ(origin.GetRequestCount(), 1u);

	s = KeyStats(instance, "a.png"sv);
	EXPECT_EQ(s.requests, 2u);
	EXPECT_EQ(s.completed, 2u);
	EXPECT_EQ(s.disconnects, 2u);
	EXPECT_EQ(s.errors, 0u);
	EXPECT_EQ(s.hits, 1u);
	EXPECT_EQ(s.hit_bytes, 500u);

	const auto g = instance.global_stats.GetSnapshot();
	EXPECT_EQ(g.disconnects, 2u);
	EXPECT_EQ(g.errors, 0u);

	/* a complete request afterwards is a plain hit */
	const auto full = Get(instance, "/a.png"sv);
	EXPECT_EQ(full.status, HttpStatus::OK);
	EXPECT_EQ(full.body, content);
	EXPECT_EQ(full.GetHeader("X-Cache"sv), "MediaCache 1.0; HIT");
}

TEST_F(HandlerTest, MethodNotAllowed)
{
	McInstance instance{config};

	const auto response = Get(instance, "/a.png"sv, {}, HttpMethod::POST);
	EXPECT_EQ(response.status, HttpStatus::METHOD_NOT_ALLOWED);
	EXPECT_EQ(response.GetHeader("Allow"sv), "GET, HEAD");
	EXPECT_EQ(origin.GetRequestCount(), 0u);
}

TEST_F(HandlerTest, MissThenHit)
{
	McInstance instance{config};

	auto response = Get(instance, "/a.png"sv);
	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.body, content);
	EXPECT_EQ(response.GetHeader("X-Cache"sv), "MediaCache 1.0; MISS");
	EXPECT_EQ(response.GetHeader("Content-Type"sv), "image/png");
	EXPECT_EQ(origin.GetRequestCount(), 1u);

	response = Get(instance, "/a.png"sv);
	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.body, content);
	EXPECT_EQ(response.GetHeader("X-Cache"sv), "MediaCache 1.0; HIT");
	EXPECT_EQ(origin.GetRequestCount(), 1u);

	const auto s = KeyStats(instance, "a.png"sv);
	EXPECT_EQ(s.requests, 2u);
	EXPECT_EQ(s.completed, 2u);
	EXPECT_EQ(s.hits, 1u);
	EXPECT_EQ(s.misses, 1u);
	EXPECT_EQ(s.sent_bytes, 2000u);
	EXPECT_EQ(s.received_bytes, 1000u);

	EXPECT_EQ(instance.global_stats.GetSnapshot().requests, 2u);
}

TEST_F(HandlerTest, QueryIsPartOfKey)
{
	McInstance instance{config};

	Get(instance, "/a.png?v=1"sv);
	Get(instance, "/a.png?v=2"sv);
	Get(instance, "/a.png?v=1"sv);
	EXPECT_EQ(origin.GetRequestCount(), 2u);

	config.key.key_query = false;
	McInstance instance2{config};
	Get(instance2, "/a.png?v=3"sv);
	Get(instance2, "/a.png?v=4"sv);
	EXPECT_EQ(origin.GetRequestCount(), 3u);
}

TEST_F(HandlerTest, Expired)
{
	McInstance instance{config};

	Get(instance, "/a.png"sv);
	EXPECT_EQ(origin.GetRequestCount(), 1u);

	/* pretend the entry was fetched four hours ago */
	const auto name = CacheKeyToFileName("a.png"sv, true);
	auto m = instance.store.ReadMetadata(name);
	m.retrieved -= std::chrono::hours{4};
	instance.store.Write(name, m, AsBytes(content));

	const auto response = Get(instance, "/a.png"sv);
	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.GetHeader("X-Cache"sv), "MediaCache 1.0; MISS");
	EXPECT_EQ(origin.GetRequestCount(), 2u);
}

TEST_F(HandlerTest, Range)
{
	McInstance instance{config};

	HttpHeaderMap headers;
	headers.emplace("range", "bytes=100-199");

	auto response = Get(instance, "/a.png"sv, headers);
	EXPECT_EQ(response.status, HttpStatus::PARTIAL_CONTENT);
	EXPECT_EQ(response.GetHeader("Content-Range"sv), "bytes 100-199/1000");
	EXPECT_EQ(response.body, content.substr(100, 100));

	headers.clear();
	headers.emplace("range", "bytes=500-100");
	response = Get(instance, "/a.png"sv, headers);
	EXPECT_EQ(response.status, HttpStatus::BAD_REQUEST);
	EXPECT_EQ(response.body, "Invalid range request: invalid range: start > end");

	const auto s = KeyStats(instance, "a.png"sv);
	EXPECT_EQ(s.errors, 1u);
	EXPECT_EQ(s.misses, 1u);
}

TEST_F(HandlerTest, ETag)
{
	McInstance instance{config};

	HttpHeaderMap headers;
	headers.emplace("if-none-match", R"("e1")");

	/* the first request fetches and then answers 304 */
	auto response = Get(instance, "/a.png"sv, headers);
	EXPECT_EQ(response.status, HttpStatus::NOT_MODIFIED);
	EXPECT_TRUE(response.body.empty());
	EXPECT_EQ(origin.GetRequestCount(), 1u);

	headers.clear();
	headers.emplace("if-none-match", R"("e2")");
	response = Get(instance, "/a.png"sv, headers);
	EXPECT_EQ(response.status, HttpStatus::OK);
	EXPECT_EQ(response.body, content);
}

TEST_F(HandlerTest, BadRequests)
{
	McInstance instance{config};

	auto response = Get(instance, "/../etc/passwd"sv);
	EXPECT_EQ(response.status, HttpStatus::BAD_REQUEST);
	EXPECT_EQ(response.body, "invalid path");

	HttpHeaderMap headers;
	headers.emplace("if-modified-since", "whenever");
	response = Get(instance, "/a.png"sv, headers);
	EXPECT_EQ(response.status, HttpStatus::BAD_REQUEST);
	EXPECT_EQ(response.body, "error parsing If-Modified-Since header");

	EXPECT_EQ(origin.GetRequestCount(), 0u);
	EXPECT_EQ(instance.global_stats.GetSnapshot().errors, 2u);
}

TEST_F(HandlerTest, FetchError)
{
	config.upstreams = {fmt::format("http://127.0.0.1:{}",
					CreateListener("127.0.0.1:0").GetLocalPort())};
	McInstance instance{config};

	const auto response = Get(instance, "/a.png"sv);
	EXPECT_EQ(response.status, HttpStatus::INTERNAL_SERVER_ERROR);
	EXPECT_EQ(response.body, "error fetching file");
	EXPECT_EQ(KeyStats(instance, "a.png"sv).errors, 1u);
	EXPECT_EQ(dir.CountFiles(), 0u);
}

TEST_F(HandlerTest, OriginErrorIsCached)
{
	config.canned_replies.emplace(404, "not here");
	McInstance instance{config};

	auto response = Get(instance, "/missing.png"sv);
	EXPECT_EQ(response.status, HttpStatus::NOT_FOUND);
	EXPECT_EQ(response.body, "not here");
	EXPECT_EQ(response.GetHeader("X-Cache"sv), "MediaCache 1.0; MISS");

	response = Get(instance, "/missing.png"sv);
	EXPECT_EQ(response.status, HttpStatus::NOT_FOUND);
	EXPECT_EQ(response.GetHeader("X-Cache"sv), "MediaCache 1.0; HIT");
	EXPECT_EQ(origin.GetRequestCount(), 1u);
}

TEST_F(HandlerTest, ConcurrentMisses)
{
	FakeOrigin::Resource r;
	r.body = content;
	r.delay = std::chrono::milliseconds{200};
	origin.Set("/media/slow.png"sv, std::move(r));

	McInstance instance{config};

	constexpr unsigned n = 8;
	std::vector<RecordingResponseWriter> responses(n);
	std::vector<std::thread> threads;
	for (unsigned i = 0; i < n; ++i)
		threads.emplace_back([&instance, &responses, i]{
			responses[i] = Get(instance, "/slow.png"sv);
		});

	for (auto &t : threads)
		t.join();

	EXPECT_EQ(origin.GetRequestCount(), 1u);
	for (const auto &response : responses) {
		EXPECT_EQ(response.status, HttpStatus::OK);
		EXPECT_EQ(response.body, content);
	}

	const auto s = KeyStats(instance, "slow.png"sv);
	EXPECT_EQ(s.requests, n);
	EXPECT_EQ(s.completed, n);
	EXPECT_EQ(s.hits + s.misses, n);
	EXPECT_EQ(s.received_bytes, content.size());
}

TEST_F(HandlerTest, OverHttp)
{
	McInstance instance{config};
	HttpServer server{instance, CreateListener("127.0.0.1:0"),
			  std::chrono::seconds{5}};
	server.Start(4);

	const auto url = fmt::format("http://127.0.0.1:{}", server.GetPort());

	auto response = TestHttpRequest(url + "/a.png");
	EXPECT_EQ(response.status, 200u);
	EXPECT_EQ(response.body, content);
	EXPECT_EQ(response.GetHeader("x-cache"sv), "MediaCache 1.0; MISS");
	EXPECT_EQ(response.GetHeader("content-length"sv), "1000");

	response = TestHttpRequest(url + "/a.png", {"Range: bytes=100-199"});
	EXPECT_EQ(response.status, 206u);
	EXPECT_EQ(response.GetHeader("content-range"sv), "bytes 100-199/1000");
	EXPECT_EQ(response.body, content.substr(100, 100));

	response = TestHttpRequest(url + "/a.png", {}, true);
	EXPECT_EQ(response.status, 200u);
	EXPECT_TRUE(response.body.empty());
	EXPECT_EQ(response.GetHeader("x-cache"sv), "MediaCache 1.0; HIT");

	response = TestHttpRequest(url + "/a.png", {R"(If-None-Match: "e1")"});
	EXPECT_EQ(response.status, 304u);

	response = TestHttpRequest(url + "/healthz");
	EXPECT_EQ(response.status, 200u);
	EXPECT_EQ(response.body, "OK");

	server.Stop();

	EXPECT_EQ(origin.GetRequestCount(), 1u);
}
