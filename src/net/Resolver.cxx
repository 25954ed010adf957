// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Resolver.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringSplit.hxx"

#include <string>

#include <string.h>
#include <sys/socket.h>

AddressInfoList
Resolve(const char *node, const char *service,
	const struct addrinfo *hints)
{
	struct addrinfo *ai;
	int error = getaddrinfo(node, service, hints, &ai);
	if (error != 0)
		throw FmtRuntimeError("Failed to resolve '{}': {}",
				      node != nullptr ? node : "*",
				      gai_strerror(error));

	return AddressInfoList{ai};
}

AddressInfoList
ResolveListen(const char *listen)
{
	std::string_view s{listen};
	std::string_view host, port;

	if (s.starts_with('[')) {
		/* bracketed IPv6 address */
		const auto end = s.find(']');
		if (end == s.npos || end + 1 >= s.size() || s[end + 1] != ':')
			throw FmtRuntimeError("Malformed listener address: {}",
					      listen);

		host = s.substr(1, end - 1);
		port = s.substr(end + 2);
	} else {
		auto [a, b] = SplitLast(s, ':');
		if (b.data() == nullptr)
			throw FmtRuntimeError("Port missing in listener address: {}",
					      listen);

		host = a;
		port = b;
	}

	if (port.empty())
		throw FmtRuntimeError("Port missing in listener address: {}",
				      listen);

	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_flags = AI_PASSIVE|AI_ADDRCONFIG;
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	const std::string host_string{host}, port_string{port};
	return Resolve(host.empty() ? nullptr : host_string.c_str(),
		       port_string.c_str(), &hints);
}
