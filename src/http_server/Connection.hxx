// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Request.hxx"
#include "ResponseWriter.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "thread/Job.hxx"

#include <cstdint>
#include <string>

class HttpServer;

/**
 * One HTTP/1.1 connection accepted by #HttpServer.  It is a
 * #ThreadJob: a worker thread receives requests, passes them to the
 * #HttpServerRequestHandler and writes the responses, until no more
 * request data is buffered.  Then the connection is parked in the
 * #HttpServer until the peer sends more.  The object deletes itself
 * when the peer closes the connection or keep-alive is disabled.
 */
class HttpServerConnection final : public ThreadJob, public HttpResponseWriter {
	HttpServer &server;

	UniqueSocketDescriptor socket;

	/**
	 * Received data which has not been parsed yet.
	 */
	std::string input;

	HttpMethod request_method;

	bool keep_alive;

	/**
	 * The response head being assembled by SetHeader().
	 */
	std::string response_headers;

	bool head_committed;

	/**
	 * The announced response body length or -1 if unknown.
	 */
	int_least64_t content_length;

	uint_least64_t body_sent;

	/**
	 * Set by Run() if the connection shall be parked by Done().
	 */
	bool park = false;

public:
	HttpServerConnection(HttpServer &_server,
			     UniqueSocketDescriptor &&_socket) noexcept;

	/**
	 * Shut down the socket, waking up a worker blocked in
	 * recv().  May be called from any thread.
	 */
	void Shutdown() noexcept;

	SocketDescriptor GetSocket() const noexcept {
		return socket;
	}

	/* virtual methods from class ThreadJob */
	void Run() noexcept override;
	void Done() noexcept override;

	/* virtual methods from class HttpResponseWriter */
	void SetHeader(std::string_view name, std::string_view value) override;
	void WriteHead(HttpStatus status) override;
	void WriteBody(std::span<const std::byte> src) override;
	void SendFile(FileDescriptor fd, off_t offset,
		      std::size_t length) override;
	bool IsHeadCommitted() const noexcept override {
		return head_committed;
	}

	uint_least64_t GetBodyBytesSent() const noexcept override {
		return body_sent;
	}

private:
	/**
	 * Receive the next request head.
	 *
	 * @return false if the peer has closed the connection
	 * cleanly between two requests
	 */
	bool ReadRequest(HttpServerRequest &request);

	void ParseRequestHead(std::string_view head,
			      HttpServerRequest &request);

	void HandleRequest(const HttpServerRequest &request);

	/**
	 * Reply with an error status and disable keep-alive.  Used
	 * for protocol errors before the handler is invoked.
	 */
	void SendError(HttpStatus status, std::string_view msg);

	void SendAll(std::span<const std::byte> src);

	void ResetResponse() noexcept;
};
