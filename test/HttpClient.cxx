// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpClient.hxx"
#include "lib/curl/Adapter.hxx"
#include "lib/curl/Easy.hxx"
#include "lib/curl/Handler.hxx"
#include "lib/curl/Init.hxx"
#include "http/Status.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <new>
#include <optional>

namespace {

class CollectHandler final : public CurlResponseHandler {
public:
	TestHttpResponse response;
	std::exception_ptr error;

	void OnHeaders(HttpStatus status, Curl::Headers &&headers) override {
		response.status = unsigned(status);
		response.headers = std::move(headers);
	}

	void OnData(std::span<const std::byte> data) override {
		response.body.append(ToStringView(data));
	}

	void OnEnd() override {
	}

	void OnError(std::exception_ptr e) noexcept override {
		error = std::move(e);
	}
};

class StringList {
	struct curl_slist *head = nullptr;

public:
	StringList() = default;

	~StringList() noexcept {
		curl_slist_free_all(head);
	}

	StringList(const StringList &) = delete;
	StringList &operator=(const StringList &) = delete;

	void Append(const char *s) {
		auto *n = curl_slist_append(head, s);
		if (n == nullptr)
			throw std::bad_alloc{};
		head = n;
	}

	struct curl_slist *Get() const noexcept {
		return head;
	}
};

} // anonymous namespace

TestHttpResponse
TestHttpRequest(const std::string &url,
		const std::vector<std::string> &request_headers,
		bool head)
{
	CollectHandler handler;
	CurlResponseHandlerAdapter adapter{handler};

	StringList header_list;
	for (const auto &i : request_headers)
		header_list.Append(i.c_str());

	CurlEasy easy{url.c_str()};
	easy.SetNoSignal();
	easy.SetTimeout(std::chrono::seconds{30});
	if (header_list.Get() != nullptr)
		easy.SetOption(CURLOPT_HTTPHEADER, header_list.Get());
	if (head)
		easy.SetOption(CURLOPT_NOBODY, 1L);
	adapter.Install(easy);

	adapter.Done(easy.Perform());

	if (handler.error)
		std::rethrow_exception(handler.error);

	return std::move(handler.response);
}

namespace {

/**
 * Initialize libCURL once for the whole test program, before any
 * thread is started.
 */
class CurlEnvironment final : public ::testing::Environment {
	std::optional<ScopeCurlInit> init;

public:
	void SetUp() override {
		init.emplace();
	}

	void TearDown() override {
		init.reset();
	}
};

[[maybe_unused]]
::testing::Environment *const curl_environment =
	::testing::AddGlobalTestEnvironment(new CurlEnvironment);

} // anonymous namespace
