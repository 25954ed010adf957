// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ResponseWriter.hxx"
#include "http/Status.hxx"
#include "io/FileDescriptor.hxx"
#include "system/Error.hxx"
#include "util/SpanCast.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <stdexcept>

void
HttpResponseWriter::SendFile(FileDescriptor fd, off_t offset,
			     std::size_t length)
{
	std::array<std::byte, 65536> buffer;

	while (length > 0) {
		const std::size_t n = std::min(length, buffer.size());
		ssize_t nbytes = fd.ReadAt(offset, std::span{buffer}.first(n));
		if (nbytes < 0)
			throw MakeErrno("Failed to read file");

		if (nbytes == 0)
			throw std::runtime_error("File was truncated while sending");

		WriteBody(std::span{buffer}.first(nbytes));
		offset += nbytes;
		length -= nbytes;
	}
}

void
HttpResponseWriter::SendPlain(HttpStatus status, std::string_view body)
{
	SetHeader("Content-Type", "text/plain; charset=utf-8");
	SetHeader("Content-Length", fmt::format("{}", body.size()));
	WriteHead(status);

	if (!body.empty())
		WriteBody(AsBytes(body));
}
