// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RecordingResponseWriter.hxx"
#include "net/SocketProtocolError.hxx"
#include "util/SpanCast.hxx"

#include <algorithm>
#include <stdexcept>

std::string_view
RecordingResponseWriter::GetHeader(std::string_view name) const noexcept
{
	auto i = headers.find(name);
	if (i == headers.end())
		return {};

	return i->second;
}

void
RecordingResponseWriter::SetHeader(std::string_view name,
				   std::string_view value)
{
	if (head_committed)
		throw std::logic_error("SetHeader() after WriteHead()");

	headers.emplace(name, value);
}

void
RecordingResponseWriter::WriteHead(HttpStatus _status)
{
	if (head_committed)
		throw std::logic_error("WriteHead() called twice");

	status = _status;
	head_committed = true;
}

void
RecordingResponseWriter::WriteBody(std::span<const std::byte> src)
{
	if (!head_committed)
		throw std::logic_error("WriteBody() before WriteHead()");

	const std::size_t room = disconnect_after - std::min(body.size(),
							       disconnect_after);
	if (src.size() > room) {
		body.append(ToStringView(src.first(room)));
		throw SocketClosedPrematurelyError();
	}

	body.append(ToStringView(src));
}
