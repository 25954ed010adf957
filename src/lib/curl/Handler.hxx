// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Headers.hxx"

#include <cstddef>
#include <exception>
#include <span>

enum class HttpStatus : uint_least16_t;

/**
 * Asynchronous response handler for a #CurlEasy.  It is installed
 * with a #CurlResponseHandlerAdapter.
 */
class CurlResponseHandler {
public:
	/**
	 * Status line and headers have been received.  May throw to
	 * abort the transfer; the exception is then passed to
	 * OnError().
	 */
	virtual void OnHeaders(HttpStatus status, Curl::Headers &&headers) = 0;

	/**
	 * Response body data has been received.  May throw to abort
	 * the transfer; the exception is then passed to OnError().
	 */
	virtual void OnData(std::span<const std::byte> data) = 0;

	/**
	 * The response has been received completely.
	 */
	virtual void OnEnd() = 0;

	/**
	 * An error has occurred.
	 */
	virtual void OnError(std::exception_ptr e) noexcept = 0;
};
