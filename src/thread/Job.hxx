// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/intrusive/list_hook.hpp>

/**
 * A job that shall be executed in a worker thread.
 */
class ThreadJob
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {
public:
	enum class State {
		/**
		 * The job is not in any queue.
		 */
		INITIAL,

		/**
		 * The job has been added to the queue, but is not being worked on
		 * yet.
		 */
		WAITING,

		/**
		 * The job is being performed via Run().
		 */
		BUSY,
	};

	State state = State::INITIAL;

	virtual ~ThreadJob() noexcept = default;

	/**
	 * Perform the work.  Called in a worker thread.
	 */
	virtual void Run() noexcept = 0;

	/**
	 * The job has finished or was discarded during shutdown.  It
	 * is no longer referenced by the queue and may destroy
	 * itself.
	 */
	virtual void Done() noexcept = 0;
};
