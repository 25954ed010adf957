// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Server.hxx"
#include "Connection.hxx"
#include "io/Logger.hxx"
#include "system/Error.hxx"

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <errno.h>
#include <unistd.h>

static constexpr std::string_view log_domain = "http_server";

HttpServer::HttpServer(HttpServerRequestHandler &_handler,
		       UniqueSocketDescriptor &&_listener,
		       std::chrono::milliseconds _idle_timeout) noexcept
	:handler(_handler), listener(std::move(_listener)),
	 idle_timeout(_idle_timeout)
{
}

HttpServer::~HttpServer() noexcept
{
	Stop();
}

void
HttpServer::Start(unsigned n_workers)
{
	int fd = epoll_create1(EPOLL_CLOEXEC);
	if (fd < 0)
		throw MakeErrno("epoll_create1() failed");
	epoll_fd = UniqueFileDescriptor{FileDescriptor{fd}};

	fd = eventfd(0, EFD_NONBLOCK|EFD_CLOEXEC);
	if (fd < 0)
		throw MakeErrno("eventfd() failed");
	wake_fd = UniqueFileDescriptor{FileDescriptor{fd}};

	struct epoll_event event{};
	event.events = EPOLLIN;
	event.data.ptr = nullptr;
	if (epoll_ctl(epoll_fd.Get(), EPOLL_CTL_ADD, wake_fd.Get(), &event) < 0)
		throw MakeErrno("epoll_ctl() failed");

	pool.Start(n_workers);
	poll_thread = std::thread{[this]{ PollLoop(); }};
	accept_thread = std::thread{[this]{ AcceptLoop(); }};
}

void
HttpServer::Stop() noexcept
{
	if (stopping.exchange(true))
		return;

	/* wake up accept() */
	shutdown(listener.Get(), SHUT_RDWR);

	if (accept_thread.joinable())
		accept_thread.join();

	if (wake_fd.IsDefined()) {
		static constexpr uint64_t value = 1;
		if (write(wake_fd.Get(), &value, sizeof(value)) < 0)
			LogConcat(1, log_domain, "Failed to wake up the poll thread");
	}

	if (poll_thread.joinable())
		poll_thread.join();

	{
		const std::scoped_lock lock{connections_mutex};
		for (auto *c : connections)
			c->Shutdown();
	}

	pool.StopAndJoin();

	/* Park() refuses new connections now; dispose of those
	   which were parked before */
	std::vector<HttpServerConnection *> idle;

	{
		const std::scoped_lock lock{connections_mutex};
		for (const auto &[c, deadline] : parked) {
			connections.erase(c);
			idle.push_back(c);
		}

		parked.clear();
	}

	for (auto *c : idle)
		delete c;
}

void
HttpServer::RemoveConnection(HttpServerConnection &c) noexcept
{
	const std::scoped_lock lock{connections_mutex};
	connections.erase(&c);
}

void
HttpServer::AcceptLoop() noexcept
{
	while (!stopping) {
		UniqueSocketDescriptor fd;

		try {
			fd = listener.Accept();
		} catch (...) {
			if (stopping)
				break;

			LogConcat(1, log_domain, std::current_exception());

			/* probably out of file descriptors; don't spin */
			std::this_thread::sleep_for(std::chrono::milliseconds{100});
			continue;
		}

		if (!fd.IsDefined())
			continue;

		fd.SetNoDelay();
		fd.SetTimeout(idle_timeout);

		auto *c = new HttpServerConnection(*this, std::move(fd));

		{
			const std::scoped_lock lock{connections_mutex};
			connections.insert(c);
		}

		if (!Park(*c)) {
			RemoveConnection(*c);
			delete c;
		}
	}
}

bool
HttpServer::Park(HttpServerConnection &c) noexcept
{
	const std::scoped_lock lock{connections_mutex};

	if (stopping)
		return false;

	struct epoll_event event{};
	event.events = EPOLLIN|EPOLLRDHUP|EPOLLONESHOT;
	event.data.ptr = &c;
	if (epoll_ctl(epoll_fd.Get(), EPOLL_CTL_ADD, c.GetSocket().Get(),
		      &event) < 0) {
		LogConcat(1, log_domain,
			  MakeErrno("Failed to register connection").what());
		return false;
	}

	parked.emplace(&c, Clock::now() + idle_timeout);
	return true;
}

void
HttpServer::Unpark(HttpServerConnection &c) noexcept
{
	epoll_ctl(epoll_fd.Get(), EPOLL_CTL_DEL, c.GetSocket().Get(), nullptr);
	parked.erase(&c);
}

int
HttpServer::ExpireParked() noexcept
{
	const auto now = Clock::now();
	std::vector<HttpServerConnection *> expired;
	Clock::time_point next = Clock::time_point::max();

	{
		const std::scoped_lock lock{connections_mutex};

		for (auto i = parked.begin(); i != parked.end();) {
			auto *c = i->first;
			const auto deadline = i->second;
			++i;

			if (deadline <= now) {
				Unpark(*c);
				connections.erase(c);
				expired.push_back(c);
			} else
				next = std::min(next, deadline);
		}
	}

	for (auto *c : expired)
		delete c;

	if (next == Clock::time_point::max())
		return -1;

	const auto remaining =
		std::chrono::ceil<std::chrono::milliseconds>(next - now);
	return int(remaining.count());
}

void
HttpServer::PollLoop() noexcept
{
	std::array<struct epoll_event, 64> events;

	while (!stopping) {
		const int timeout = ExpireParked();
		const int n = epoll_wait(epoll_fd.Get(), events.data(),
					 events.size(), timeout);
		if (n < 0) {
			if (errno == EINTR)
				continue;

			LogConcat(1, log_domain,
				  MakeErrno("epoll_wait() failed").what());
			break;
		}

		for (int i = 0; i < n; ++i) {
			auto *c = (HttpServerConnection *)events[i].data.ptr;
			if (c == nullptr)
				/* woken up by Stop() */
				continue;

			{
				const std::scoped_lock lock{connections_mutex};
				if (!parked.contains(c))
					continue;

				Unpark(*c);
			}

			pool.GetQueue().Add(*c);
		}
	}
}
