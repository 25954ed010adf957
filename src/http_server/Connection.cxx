// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Connection.hxx"
#include "Error.hxx"
#include "Handler.hxx"
#include "Server.hxx"
#include "http/Status.hxx"
#include "io/FileDescriptor.hxx"
#include "io/Logger.hxx"
#include "net/SocketProtocolError.hxx"
#include "system/Error.hxx"
#include "util/CharUtil.hxx"
#include "util/SpanCast.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <utility>

#include <sys/sendfile.h>
#include <sys/socket.h>
#include <errno.h>
#include <strings.h>

static constexpr std::string_view log_domain = "http_server";

/**
 * Refuse request heads larger than this.
 */
static constexpr std::size_t MAX_REQUEST_HEAD = 8192;

HttpServerConnection::HttpServerConnection(HttpServer &_server,
					   UniqueSocketDescriptor &&_socket) noexcept
	:server(_server), socket(std::move(_socket))
{
	ResetResponse();
}

void
HttpServerConnection::Shutdown() noexcept
{
	shutdown(socket.Get(), SHUT_RDWR);
}

void
HttpServerConnection::ResetResponse() noexcept
{
	request_method = HttpMethod::UNDEFINED;
	keep_alive = true;
	response_headers.clear();
	head_committed = false;
	content_length = -1;
	body_sent = 0;
}

[[noreturn]]
static void
ThrowSocketError(int e, const char *msg)
{
	switch (e) {
	case EAGAIN:
		throw SocketTimeoutError();

	case EPIPE:
	case ECONNRESET:
		throw SocketClosedPrematurelyError();

	default:
		throw MakeErrno(e, msg);
	}
}

/**
 * Does the comma-separated list contain the given token
 * (case-insensitive)?
 */
[[gnu::pure]]
static bool
ListContains(std::string_view list, std::string_view token) noexcept
{
	while (!list.empty()) {
		auto [item, rest] = Split(list, ',');
		item = Strip(item);
		if (item.size() == token.size() &&
		    strncasecmp(item.data(), token.data(), token.size()) == 0)
			return true;

		list = rest;
	}

	return false;
}

void
HttpServerConnection::ParseRequestHead(std::string_view head,
				       HttpServerRequest &request)
{
	auto [request_line, header_lines] = Split(head, '\n');
	request_line = StripRight(request_line);

	auto [method, rest] = Split(request_line, ' ');
	auto [uri, version] = Split(rest, ' ');

	if (method.empty() || uri.empty() || version.data() == nullptr)
		throw HttpServerProtocolError(HttpStatus::BAD_REQUEST,
					      "malformed request line");

	if (!version.starts_with("HTTP/1."))
		throw HttpServerProtocolError(HttpStatus::HTTP_VERSION_NOT_SUPPORTED,
					      "This server requires HTTP 1.1.");

	request.method = http_method_parse(method);
	request_method = request.method;
	request.uri = uri;

	while (!header_lines.empty()) {
		auto [line, next] = Split(header_lines, '\n');
		header_lines = next;

		line = StripRight(line);
		if (line.empty())
			break;

		auto [name, value] = Split(line, ':');
		name = Strip(name);
		if (value.data() == nullptr || name.empty())
			throw HttpServerProtocolError(HttpStatus::BAD_REQUEST,
						      "malformed request header");

		std::string lower{name};
		std::transform(lower.begin(), lower.end(), lower.begin(),
			       ToLowerASCII);
		request.headers.emplace(std::move(lower), Strip(value));
	}

	/* we disable keep-alive support on ancient HTTP 1.0, because
	   that feature was not well-defined and led to problems with
	   some clients */
	const auto connection = request.GetHeader("connection");
	keep_alive = version == "HTTP/1.1" &&
		(connection.data() == nullptr ||
		 !ListContains(connection, "close"));

	/* request bodies are not consumed; the connection cannot be
	   reused after a request which has one */
	const auto content_length_header = request.GetHeader("content-length");
	if (request.GetHeader("transfer-encoding").data() != nullptr ||
	    (content_length_header.data() != nullptr &&
	     content_length_header != "0"))
		keep_alive = false;
}

bool
HttpServerConnection::ReadRequest(HttpServerRequest &request)
{
	std::size_t end;

	while ((end = input.find("\r\n\r\n")) == input.npos) {
		if (input.size() > MAX_REQUEST_HEAD) {
			SendError(HttpStatus::REQUEST_HEADER_FIELDS_TOO_LARGE,
				  "Request header is too large");
			return false;
		}

		std::array<std::byte, 4096> buffer;
		ssize_t nbytes = socket.Receive(buffer);
		if (nbytes > 0) {
			input.append(ToStringView(std::span{buffer}.first(nbytes)));
			continue;
		}

		if (nbytes == 0) {
			if (input.empty())
				/* clean close between two requests */
				return false;

			throw SocketClosedPrematurelyError();
		}

		const int e = errno;
		if (e == EINTR)
			continue;

		if (e == EAGAIN && input.empty())
			/* idle keep-alive connection timed out */
			return false;

		if (e == EAGAIN) {
			SendError(HttpStatus::REQUEST_TIMEOUT,
				  "Request timeout");
			return false;
		}

		ThrowSocketError(e, "Failed to receive");
	}

	if (end > MAX_REQUEST_HEAD) {
		SendError(HttpStatus::REQUEST_HEADER_FIELDS_TOO_LARGE,
			  "Request header is too large");
		return false;
	}

	const std::string_view head{input.data(), end + 2};

	try {
		ParseRequestHead(head, request);
	} catch (const HttpServerProtocolError &e) {
		LogConcat(4, log_domain, e.what());
		SendError(e.GetStatus(), e.what());
		return false;
	}

	input.erase(0, end + 4);
	return true;
}

void
HttpServerConnection::SendError(HttpStatus status, std::string_view msg)
{
	ResetResponse();
	keep_alive = false;
	SendPlain(status, msg);
}

void
HttpServerConnection::HandleRequest(const HttpServerRequest &request)
{
	try {
		server.GetHandler().HandleHttpRequest(request, *this);
	} catch (const SocketProtocolError &) {
		throw;
	} catch (...) {
		LogConcat(1, log_domain, std::current_exception());

		if (head_committed) {
			keep_alive = false;
			return;
		}

		response_headers.clear();
		content_length = -1;
		SendPlain(HttpStatus::INTERNAL_SERVER_ERROR,
			  "Internal server error");
		return;
	}

	if (!head_committed) {
		LogConcat(1, log_domain, "Request handler did not respond");
		SendPlain(HttpStatus::INTERNAL_SERVER_ERROR,
			  "Internal server error");
		return;
	}

	if (request_method != HttpMethod::HEAD && content_length >= 0 &&
	    body_sent != uint_least64_t(content_length))
		/* the announced body length was not met; the peer
		   cannot find the next response */
		keep_alive = false;
}

void
HttpServerConnection::Run() noexcept
try {
	park = false;

	while (true) {
		HttpServerRequest request;
		if (!ReadRequest(request))
			break;

		HandleRequest(request);

		if (!keep_alive)
			break;

		ResetResponse();

		if (input.empty()) {
			/* no pipelined request; give the worker back
			   until the peer sends the next one */
			park = true;
			break;
		}
	}
} catch (const SocketClosedPrematurelyError &) {
	LogConcat(5, log_domain, "Client disconnected");
} catch (const SocketTimeoutError &) {
	LogConcat(4, log_domain, "Client timeout");
} catch (...) {
	LogConcat(2, log_domain, std::current_exception());
}

void
HttpServerConnection::Done() noexcept
{
	if (std::exchange(park, false) && server.Park(*this))
		return;

	server.RemoveConnection(*this);
	delete this;
}

void
HttpServerConnection::SetHeader(std::string_view name, std::string_view value)
{
	if (head_committed)
		throw std::logic_error("Response head already sent");

	if (name.size() == 14 &&
	    strncasecmp(name.data(), "content-length", 14) == 0)
		content_length = std::stoll(std::string{value});

	response_headers.append(name);
	response_headers.append(": ");
	response_headers.append(value);
	response_headers.append("\r\n");
}

void
HttpServerConnection::WriteHead(HttpStatus status)
{
	if (head_committed)
		throw std::logic_error("Response head already sent");

	const char *reason = http_status_to_string(status);
	if (reason == nullptr)
		reason = "Unknown";

	if (content_length < 0 && !http_status_is_empty(status))
		/* the end of the body is signalled by closing the
		   connection */
		keep_alive = false;

	std::string head = fmt::format("HTTP/1.1 {} {}\r\n",
				       unsigned(status), reason);
	head.append(response_headers);

	if (!keep_alive)
		head.append("Connection: close\r\n");

	head.append("\r\n");

	head_committed = true;
	SendAll(AsBytes(head));
}

void
HttpServerConnection::WriteBody(std::span<const std::byte> src)
{
	if (!head_committed)
		throw std::logic_error("Response head not sent");

	if (request_method == HttpMethod::HEAD)
		return;

	SendAll(src);
	body_sent += src.size();
}

void
HttpServerConnection::SendFile(FileDescriptor fd, off_t offset,
			       std::size_t length)
{
	if (!head_committed)
		throw std::logic_error("Response head not sent");

	if (request_method == HttpMethod::HEAD)
		return;

	while (length > 0) {
		ssize_t nbytes = sendfile(socket.Get(), fd.Get(), &offset, length);
		if (nbytes < 0) {
			const int e = errno;
			if (e == EINTR)
				continue;

			ThrowSocketError(e, "sendfile() failed");
		}

		if (nbytes == 0)
			throw std::runtime_error("File was truncated while sending");

		length -= nbytes;
		body_sent += nbytes;
	}
}

void
HttpServerConnection::SendAll(std::span<const std::byte> src)
{
	while (!src.empty()) {
		ssize_t nbytes = socket.Send(src);
		if (nbytes < 0) {
			const int e = errno;
			if (e == EINTR)
				continue;

			ThrowSocketError(e, "Failed to send");
		}

		src = src.subspan(nbytes);
	}
}
