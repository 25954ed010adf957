// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Queue.hxx"

#include <cassert>

ThreadQueue::~ThreadQueue() noexcept
{
	assert(!alive);
	assert(busy.empty());

	std::unique_lock lock{mutex};
	DisposeWaiting(lock);
}

void
ThreadQueue::DisposeWaiting(std::unique_lock<std::mutex> &lock) noexcept
{
	while (!waiting.empty()) {
		auto &job = waiting.front();
		waiting.pop_front();
		job.state = ThreadJob::State::INITIAL;

		lock.unlock();
		job.Done();
		lock.lock();
	}
}

void
ThreadQueue::Stop() noexcept
{
	std::unique_lock lock{mutex};
	alive = false;
	cond.notify_all();

	DisposeWaiting(lock);
}

void
ThreadQueue::Add(ThreadJob &job) noexcept
{
	std::unique_lock lock{mutex};
	assert(job.state == ThreadJob::State::INITIAL);

	if (!alive) {
		lock.unlock();
		job.Done();
		return;
	}

	job.state = ThreadJob::State::WAITING;
	waiting.push_back(job);
	cond.notify_one();
}

ThreadJob *
ThreadQueue::Wait() noexcept
{
	std::unique_lock lock{mutex};

	while (true) {
		if (!alive)
			return nullptr;

		if (!waiting.empty()) {
			auto &job = waiting.front();
			assert(job.state == ThreadJob::State::WAITING);

			job.state = ThreadJob::State::BUSY;
			waiting.pop_front();
			busy.push_back(job);
			return &job;
		}

		/* queue is empty, wait for a new job to be added */
		cond.wait(lock);
	}
}

void
ThreadQueue::Done(ThreadJob &job) noexcept
{
	assert(job.state == ThreadJob::State::BUSY);

	{
		const std::scoped_lock lock{mutex};
		job.state = ThreadJob::State::INITIAL;
		busy.erase(busy.iterator_to(job));
	}

	job.Done();
}
