// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFileDescriptor.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "thread/Pool.hxx"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_set>

class HttpServerRequestHandler;
class HttpServerConnection;

/**
 * A blocking HTTP/1.1 server.  One thread accepts connections; each
 * request is served by a worker of a #ThreadPool.  Between two
 * requests, a connection does not occupy a worker: it is parked in
 * an epoll set watched by the poll thread, which queues it again
 * when the next request arrives and closes it after the idle
 * timeout.
 */
class HttpServer {
	HttpServerRequestHandler &handler;

	UniqueSocketDescriptor listener;

	const std::chrono::milliseconds idle_timeout;

	ThreadPool pool;

	std::thread accept_thread;

	std::atomic_bool stopping{false};

	UniqueFileDescriptor epoll_fd;

	/**
	 * An eventfd which wakes up the poll thread on shutdown.
	 */
	UniqueFileDescriptor wake_fd;

	std::thread poll_thread;

	using Clock = std::chrono::steady_clock;

	/**
	 * Protects #connections and #parked.
	 */
	std::mutex connections_mutex;
	std::unordered_set<HttpServerConnection *> connections;

	/**
	 * Idle connections registered in #epoll_fd, with the time
	 * they will be closed.
	 */
	std::map<HttpServerConnection *, Clock::time_point> parked;

public:
	/**
	 * @param _listener a listening socket, e.g. from
	 * CreateListener()
	 */
	HttpServer(HttpServerRequestHandler &_handler,
		   UniqueSocketDescriptor &&_listener,
		   std::chrono::milliseconds _idle_timeout=std::chrono::seconds{60}) noexcept;

	~HttpServer() noexcept;

	HttpServer(const HttpServer &) = delete;
	HttpServer &operator=(const HttpServer &) = delete;

	/**
	 * The port the listener is bound to.
	 */
	[[gnu::pure]]
	unsigned GetPort() const noexcept {
		return listener.GetLocalPort();
	}

	/**
	 * Launch the worker threads, the poll thread and the accept
	 * thread.  Throws on error.
	 */
	void Start(unsigned n_workers);

	/**
	 * Stop accepting connections, close all open connections and
	 * wait for the workers to finish.
	 */
	void Stop() noexcept;

	HttpServerRequestHandler &GetHandler() noexcept {
		return handler;
	}

	std::chrono::milliseconds GetIdleTimeout() const noexcept {
		return idle_timeout;
	}

	void RemoveConnection(HttpServerConnection &c) noexcept;

	/**
	 * Wait for the next request on this idle connection without
	 * occupying a worker.
	 *
	 * @return false if the connection could not be parked (e.g.
	 * during shutdown); the caller must dispose of it
	 */
	bool Park(HttpServerConnection &c) noexcept;

	std::size_t GetParkedCount() noexcept {
		const std::scoped_lock lock{connections_mutex};
		return parked.size();
	}

private:
	void AcceptLoop() noexcept;
	void PollLoop() noexcept;

	/**
	 * Close parked connections whose idle timeout has expired.
	 *
	 * @return the number of milliseconds until the next
	 * expiry or -1 if nothing is parked
	 */
	int ExpireParked() noexcept;

	void Unpark(HttpServerConnection &c) noexcept;
};
