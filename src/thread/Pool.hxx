// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Queue.hxx"

#include <forward_list>

class ThreadWorker;

/**
 * A #ThreadQueue with a fixed number of #ThreadWorker instances.
 */
class ThreadPool {
	ThreadQueue queue;

	std::forward_list<ThreadWorker> workers;

public:
	ThreadPool() noexcept;
	~ThreadPool() noexcept;

	ThreadPool(const ThreadPool &) = delete;
	ThreadPool &operator=(const ThreadPool &) = delete;

	ThreadQueue &GetQueue() noexcept {
		return queue;
	}

	/**
	 * Launch the worker threads.  Throws on error.
	 */
	void Start(unsigned n_workers);

	/**
	 * Stop the queue and wait for all workers to finish their
	 * current job.
	 */
	void StopAndJoin() noexcept;
};
