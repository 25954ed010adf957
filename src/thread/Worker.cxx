// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Worker.hxx"
#include "Queue.hxx"
#include "system/Error.hxx"
#include "util/ScopeExit.hxx"

void *
ThreadWorker::Run(void *ctx) noexcept
{
	/* reduce glibc's thread cancellation overhead */
	pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, nullptr);

	auto &w = *(ThreadWorker *)ctx;
	ThreadQueue &q = w.queue;

	ThreadJob *job;
	while ((job = q.Wait()) != nullptr) {
		job->Run();
		q.Done(*job);
	}

	return nullptr;
}

void
ThreadWorker::Start()
{
	pthread_attr_t attr;
	pthread_attr_init(&attr);
	AtScopeExit(&attr) { pthread_attr_destroy(&attr); };

	/* libcurl with TLS needs more than the default minimum */
	pthread_attr_setstacksize(&attr, 512 * 1024);

	int error = pthread_create(&thread, &attr, Run, this);
	if (error != 0)
		throw MakeErrno(error, "Failed to create worker thread");

	joinable = true;
}

void
ThreadWorker::Join() noexcept
{
	if (joinable) {
		pthread_join(thread, nullptr);
		joinable = false;
	}
}
