// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstddef>
#include <span>

#include <sys/types.h>

class UniqueSocketDescriptor;

/**
 * An OO wrapper for a socket descriptor.  It does not own the
 * descriptor; see #UniqueSocketDescriptor.
 */
class SocketDescriptor {
protected:
	int fd;

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:fd(_fd) {}

	constexpr bool operator==(const SocketDescriptor &other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(-1);
	}

	void Close() noexcept;

	/**
	 * Returns the socket error (SO_ERROR) or 0.
	 */
	[[gnu::pure]]
	int GetError() const noexcept;

	/**
	 * Returns the local port number or 0 on error.
	 */
	[[gnu::pure]]
	unsigned GetLocalPort() const noexcept;

	bool SetOption(int level, int name,
		       const void *value, std::size_t size) const noexcept;

	bool SetBoolOption(int level, int name, bool value) const noexcept {
		const int i = value;
		return SetOption(level, name, &i, sizeof(i));
	}

	bool SetReuseAddress(bool value=true) const noexcept;
	bool SetNoDelay(bool value=true) const noexcept;

	/**
	 * Set SO_RCVTIMEO and SO_SNDTIMEO.
	 */
	bool SetTimeout(std::chrono::milliseconds timeout) const noexcept;

	/**
	 * Accept a connection.  Throws on error (but not on EINTR
	 * and EAGAIN; these return an undefined socket).
	 */
	UniqueSocketDescriptor Accept() const;

	void ShutdownWrite() const noexcept;

	ssize_t Receive(std::span<std::byte> dest, int flags=0) const noexcept;

	/**
	 * Send data.  SIGPIPE is suppressed.
	 */
	ssize_t Send(std::span<const std::byte> src, int flags=0) const noexcept;
};
