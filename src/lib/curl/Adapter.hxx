// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Headers.hxx"

#include <curl/curl.h>

#include <cstddef>
#include <exception>
#include <span>
#include <string_view>

class CurlEasy;
class CurlResponseHandler;

/**
 * Glue code between libCURL's callbacks and a #CurlResponseHandler.
 * Call Install() before the transfer and Done() after it.
 */
class CurlResponseHandlerAdapter {
	CurlEasy *easy = nullptr;

	CurlResponseHandler &handler;

	Curl::Headers headers;

	/**
	 * An exception thrown by the handler; it aborted the transfer
	 * and is delivered by Done().
	 */
	std::exception_ptr postponed_error;

	enum class State {
		HEADERS,
		BODY,
		CLOSED,
	} state = State::HEADERS;

	char error_buffer[CURL_ERROR_SIZE];

public:
	explicit CurlResponseHandlerAdapter(CurlResponseHandler &_handler) noexcept
		:handler(_handler)
	{
		error_buffer[0] = 0;
	}

	CurlResponseHandlerAdapter(const CurlResponseHandlerAdapter &) = delete;
	CurlResponseHandlerAdapter &operator=(const CurlResponseHandlerAdapter &) = delete;

	void Install(CurlEasy &easy);

	/**
	 * The transfer has finished (successfully or not).  Invokes
	 * either CurlResponseHandler::OnEnd() or
	 * CurlResponseHandler::OnError().
	 */
	void Done(CURLcode result) noexcept;

private:
	void FinishHeaders();
	void HeaderFunction(std::string_view s) noexcept;
	std::size_t DataReceived(std::span<const std::byte> data) noexcept;

	static std::size_t _HeaderFunction(char *ptr, std::size_t size,
					   std::size_t nmemb,
					   void *stream) noexcept;
	static std::size_t WriteFunction(char *ptr, std::size_t size,
					 std::size_t nmemb,
					 void *stream) noexcept;
};
