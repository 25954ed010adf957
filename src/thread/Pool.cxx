// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Pool.hxx"
#include "Worker.hxx"

ThreadPool::ThreadPool() noexcept = default;

ThreadPool::~ThreadPool() noexcept
{
	StopAndJoin();
}

void
ThreadPool::Start(unsigned n_workers)
{
	for (unsigned i = 0; i < n_workers; ++i)
		workers.emplace_front(queue).Start();
}

void
ThreadPool::StopAndJoin() noexcept
{
	queue.Stop();

	for (auto &i : workers)
		i.Join();
	workers.clear();
}
