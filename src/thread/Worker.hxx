// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <pthread.h>

class ThreadQueue;

/**
 * A thread that performs queued work.
 */
class ThreadWorker {
	pthread_t thread;

	ThreadQueue &queue;

	bool joinable = false;

public:
	explicit ThreadWorker(ThreadQueue &_queue) noexcept
		:queue(_queue) {}

	~ThreadWorker() noexcept {
		Join();
	}

	ThreadWorker(const ThreadWorker &) = delete;
	ThreadWorker &operator=(const ThreadWorker &) = delete;

	/**
	 * Throws exception on error.
	 */
	void Start();

	/**
	 * Wait for the thread to exit.  You must call
	 * ThreadQueue::Stop() prior to this method.
	 */
	void Join() noexcept;

private:
	static void *Run(void *ctx) noexcept;
};
