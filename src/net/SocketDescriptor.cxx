// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketDescriptor.hxx"
#include "UniqueSocketDescriptor.hxx"
#include "system/Error.hxx"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <utility>

#include <unistd.h>
#include <errno.h>

void
SocketDescriptor::Close() noexcept
{
	if (IsDefined())
		::close(std::exchange(fd, -1));
}

int
SocketDescriptor::GetError() const noexcept
{
	int s_err = 0;
	socklen_t s_err_size = sizeof(s_err);
	return getsockopt(fd, SOL_SOCKET, SO_ERROR,
			  (char *)&s_err, &s_err_size) == 0
		? s_err
		: errno;
}

unsigned
SocketDescriptor::GetLocalPort() const noexcept
{
	struct sockaddr_storage ss;
	socklen_t size = sizeof(ss);
	if (getsockname(fd, (struct sockaddr *)&ss, &size) < 0)
		return 0;

	switch (ss.ss_family) {
	case AF_INET:
		return ntohs(((const struct sockaddr_in &)ss).sin_port);

	case AF_INET6:
		return ntohs(((const struct sockaddr_in6 &)ss).sin6_port);

	default:
		return 0;
	}
}

bool
SocketDescriptor::SetOption(int level, int name,
			    const void *value, std::size_t size) const noexcept
{
	return setsockopt(fd, level, name, value, size) == 0;
}

bool
SocketDescriptor::SetReuseAddress(bool value) const noexcept
{
	return SetBoolOption(SOL_SOCKET, SO_REUSEADDR, value);
}

bool
SocketDescriptor::SetNoDelay(bool value) const noexcept
{
	return SetBoolOption(IPPROTO_TCP, TCP_NODELAY, value);
}

bool
SocketDescriptor::SetTimeout(std::chrono::milliseconds timeout) const noexcept
{
	struct timeval tv;
	tv.tv_sec = timeout.count() / 1000;
	tv.tv_usec = (timeout.count() % 1000) * 1000;

	return SetOption(SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) &&
		SetOption(SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

UniqueSocketDescriptor
SocketDescriptor::Accept() const
{
	int connection_fd = ::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);
	if (connection_fd < 0) {
		const int e = errno;
		if (e == EINTR || e == EAGAIN || e == ECONNABORTED)
			return {};

		throw MakeErrno(e, "Failed to accept connection");
	}

	return UniqueSocketDescriptor{SocketDescriptor{connection_fd}};
}

void
SocketDescriptor::ShutdownWrite() const noexcept
{
	shutdown(fd, SHUT_WR);
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest, int flags) const noexcept
{
	return ::recv(fd, dest.data(), dest.size(), flags);
}

ssize_t
SocketDescriptor::Send(std::span<const std::byte> src, int flags) const noexcept
{
	flags |= MSG_NOSIGNAL;
	return ::send(fd, src.data(), src.size(), flags);
}
