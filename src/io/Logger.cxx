// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <stdio.h>

unsigned LoggerDetail::max_level = 1;

void
LoggerDetail::Append(std::string &buffer, std::exception_ptr ep) noexcept
{
	buffer.append(GetFullMessage(ep));
}

void
LoggerDetail::WriteV(std::string_view domain, std::string_view message) noexcept
{
	std::string line;
	line.reserve(domain.size() + message.size() + 3);

	if (!domain.empty()) {
		line.append(domain);
		line.append(": ");
	}

	line.append(message);
	line.push_back('\n');

	/* a single fwrite() call keeps lines from concurrent threads
	   from interleaving */
	fwrite(line.data(), 1, line.size(), stderr);
}
