// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

class SocketProtocolError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The peer has closed the connection (or reset it) before the
 * exchange was complete.
 */
class SocketClosedPrematurelyError : public SocketProtocolError {
public:
	SocketClosedPrematurelyError()
		:SocketProtocolError("Peer closed the socket prematurely") {}
};

class SocketTimeoutError : public SocketProtocolError {
public:
	SocketTimeoutError()
		:SocketProtocolError("Timeout") {}
};
