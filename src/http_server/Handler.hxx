// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct HttpServerRequest;
class HttpResponseWriter;

class HttpServerRequestHandler {
public:
	/**
	 * Handle one request.  Called in a worker thread; may be
	 * called concurrently.
	 *
	 * Exceptions are caught by the connection: if the response
	 * head has not been sent yet, it replies "500 Internal Server
	 * Error", otherwise the connection is closed.
	 */
	virtual void HandleHttpRequest(const HttpServerRequest &request,
				       HttpResponseWriter &response) = 0;
};
