// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <sys/types.h>

enum class HttpStatus : uint_least16_t;
class FileDescriptor;

/**
 * The sending side of an HTTP response.  Headers are collected with
 * SetHeader() until WriteHead() commits them together with the
 * status.
 *
 * Write errors are thrown; a client which went away is reported as
 * #SocketClosedPrematurelyError.
 */
class HttpResponseWriter {
public:
	virtual ~HttpResponseWriter() noexcept = default;

	/**
	 * Add a response header.  Must be called before WriteHead().
	 */
	virtual void SetHeader(std::string_view name,
			       std::string_view value) = 0;

	virtual void WriteHead(HttpStatus status) = 0;

	virtual void WriteBody(std::span<const std::byte> src) = 0;

	/**
	 * Send a portion of a file as response body.  The default
	 * implementation reads it into a buffer and passes it to
	 * WriteBody().
	 */
	virtual void SendFile(FileDescriptor fd, off_t offset,
			      std::size_t length);

	[[gnu::pure]]
	virtual bool IsHeadCommitted() const noexcept = 0;

	/**
	 * The number of response body bytes sent so far.
	 */
	[[gnu::pure]]
	virtual uint_least64_t GetBodyBytesSent() const noexcept = 0;

	/**
	 * Send a complete "text/plain" response.
	 */
	void SendPlain(HttpStatus status, std::string_view body);
};
