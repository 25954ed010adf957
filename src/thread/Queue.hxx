// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Job.hxx"

#include <boost/intrusive/list.hpp>

#include <condition_variable>
#include <mutex>

/**
 * A queue that manages work for worker threads.
 */
class ThreadQueue {
	std::mutex mutex;
	std::condition_variable cond;

	bool alive = true;

	using JobList =
		boost::intrusive::list<ThreadJob,
				       boost::intrusive::constant_time_size<false>>;

	JobList waiting, busy;

public:
	ThreadQueue() noexcept = default;
	~ThreadQueue() noexcept;

	ThreadQueue(const ThreadQueue &) = delete;
	ThreadQueue &operator=(const ThreadQueue &) = delete;

	/**
	 * Cancel all Wait() calls and refuse all further calls.
	 * This is used to initiate shutdown of all threads connected
	 * to this queue.
	 */
	void Stop() noexcept;

	/**
	 * Enqueue a job, and wake up an idle thread (if there is
	 * any).  After Stop(), the job is discarded immediately via
	 * ThreadJob::Done().
	 */
	void Add(ThreadJob &job) noexcept;

	/**
	 * Dequeue an existing job or wait for a new job, and reserve
	 * it.
	 *
	 * @return nullptr if Stop() has been called
	 */
	ThreadJob *Wait() noexcept;

	/**
	 * Mark the specified job (returned by Wait()) as "done" and
	 * invoke its ThreadJob::Done() method.
	 */
	void Done(ThreadJob &job) noexcept;

private:
	/**
	 * Invoke ThreadJob::Done() on all jobs which have not been
	 * picked up by a worker yet.  Caller must hold the lock.
	 */
	void DisposeWaiting(std::unique_lock<std::mutex> &lock) noexcept;
};
