// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Status.hxx"

#include <stdexcept>

/**
 * A malformed request was received.  The connection replies with
 * the given status and is closed.
 */
class HttpServerProtocolError : public std::runtime_error {
	HttpStatus status;

public:
	HttpServerProtocolError(HttpStatus _status, const char *msg) noexcept
		:std::runtime_error(msg), status(_status) {}

	HttpStatus GetStatus() const noexcept {
		return status;
	}
};
