// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Adapter.hxx"
#include "Easy.hxx"
#include "Handler.hxx"
#include "http/Status.hxx"
#include "util/CharUtil.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>
#include <stdexcept>

void
CurlResponseHandlerAdapter::Install(CurlEasy &_easy)
{
	easy = &_easy;

	easy->SetErrorBuffer(error_buffer);
	easy->SetHeaderFunction(_HeaderFunction, this);
	easy->SetWriteFunction(WriteFunction, this);
}

void
CurlResponseHandlerAdapter::FinishHeaders()
{
	if (state != State::HEADERS)
		return;

	state = State::BODY;

	const long code = easy->GetResponseCode();
	if (code < 100 || code > 599)
		throw std::runtime_error("Invalid HTTP status from upstream");

	handler.OnHeaders(static_cast<HttpStatus>(code), std::move(headers));
}

inline void
CurlResponseHandlerAdapter::HeaderFunction(std::string_view s) noexcept
{
	if (state > State::HEADERS)
		return;

	if (s.starts_with("HTTP/")) {
		/* a new response begins; this happens after a
		   redirect or after "100 Continue" */
		headers.clear();
		return;
	}

	auto [name, value] = Split(s, ':');
	if (value.data() == nullptr)
		/* the empty line terminating a header block, or
		   garbage */
		return;

	name = Strip(name);
	if (name.empty())
		return;

	std::string lower{name};
	std::transform(lower.begin(), lower.end(), lower.begin(),
		       ToLowerASCII);

	headers.emplace(std::move(lower), Strip(value));
}

std::size_t
CurlResponseHandlerAdapter::_HeaderFunction(char *ptr, std::size_t size,
					    std::size_t nmemb,
					    void *stream) noexcept
{
	auto &c = *(CurlResponseHandlerAdapter *)stream;

	size *= nmemb;

	c.HeaderFunction({ptr, size});
	return size;
}

inline std::size_t
CurlResponseHandlerAdapter::DataReceived(std::span<const std::byte> data) noexcept
{
	try {
		FinishHeaders();
		handler.OnData(data);
		return data.size();
	} catch (...) {
		postponed_error = std::current_exception();
		state = State::CLOSED;
		/* returning a different size aborts the transfer */
		return data.empty() ? 1 : 0;
	}
}

std::size_t
CurlResponseHandlerAdapter::WriteFunction(char *ptr, std::size_t size,
					  std::size_t nmemb,
					  void *stream) noexcept
{
	auto &c = *(CurlResponseHandlerAdapter *)stream;

	size *= nmemb;
	if (size == 0)
		return 0;

	return c.DataReceived({(const std::byte *)ptr, size});
}

void
CurlResponseHandlerAdapter::Done(CURLcode result) noexcept
{
	if (postponed_error) {
		handler.OnError(std::move(postponed_error));
		return;
	}

	if (state == State::CLOSED)
		return;

	try {
		if (result != CURLE_OK) {
			state = State::CLOSED;
			const char *msg = error_buffer[0] != 0
				? error_buffer
				: curl_easy_strerror(result);
			throw Curl::Error{result, msg};
		}

		FinishHeaders();
		state = State::CLOSED;
		handler.OnEnd();
	} catch (...) {
		state = State::CLOSED;
		handler.OnError(std::current_exception());
	}
}
