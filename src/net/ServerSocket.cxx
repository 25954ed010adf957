// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ServerSocket.hxx"
#include "Resolver.hxx"
#include "system/Error.hxx"

#include <exception>

#include <sys/socket.h>
#include <errno.h>

UniqueSocketDescriptor
CreateListener(const char *listen, int backlog)
{
	const auto ai = ResolveListen(listen);

	std::exception_ptr error;

	for (const auto &i : ai) {
		UniqueSocketDescriptor fd{SocketDescriptor{
			socket(i.ai_family, i.ai_socktype|SOCK_CLOEXEC,
			       i.ai_protocol)}};
		if (!fd.IsDefined()) {
			error = std::make_exception_ptr(MakeErrno("Failed to create socket"));
			continue;
		}

		fd.SetReuseAddress();

		if (bind(fd.Get(), i.ai_addr, i.ai_addrlen) < 0) {
			error = std::make_exception_ptr(FmtErrno("Failed to bind to {}",
								 listen));
			continue;
		}

		if (::listen(fd.Get(), backlog) < 0) {
			error = std::make_exception_ptr(FmtErrno("Failed to listen on {}",
								 listen));
			continue;
		}

		return fd;
	}

	if (error)
		std::rethrow_exception(error);

	throw MakeErrno(EADDRNOTAVAIL, "No usable listener address");
}
