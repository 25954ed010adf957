// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "stats/CacheStats.hxx"

#include <atomic>
#include <chrono>
#include <shared_mutex>
#include <string_view>

/**
 * A readers/writer lock for one cache key, with usage counters and
 * the time of the last acquisition.  It satisfies the standard
 * SharedMutex requirements, so std::shared_lock and std::unique_lock
 * can be used on it.
 */
class KeyLock {
public:
	using Clock = std::chrono::steady_clock;

private:
	std::shared_mutex mutex;

	std::atomic_uint readers{0}, writers{0};

	std::atomic<Clock::time_point> touched;

public:
	/**
	 * The counters of requests for this key.
	 */
	CacheStats stats;

	KeyLock(std::string_view key, CacheStats &global_stats) noexcept
		:touched(Clock::now()), stats(key, &global_stats) {}

	KeyLock(const KeyLock &) = delete;
	KeyLock &operator=(const KeyLock &) = delete;

	void lock_shared() noexcept {
		mutex.lock_shared();
		++readers;
		touched.store(Clock::now());
	}

	void unlock_shared() noexcept {
		--readers;
		mutex.unlock_shared();
	}

	void lock() noexcept {
		mutex.lock();
		++writers;
		touched.store(Clock::now());
	}

	void unlock() noexcept {
		--writers;
		mutex.unlock();
	}

	unsigned GetReaders() const noexcept {
		return readers.load();
	}

	unsigned GetWriters() const noexcept {
		return writers.load();
	}

	/**
	 * Mark the lock as used, e.g. when a request has looked it
	 * up but not yet acquired it.
	 */
	void Touch() noexcept {
		touched.store(Clock::now());
	}

	Clock::time_point GetTouched() const noexcept {
		return touched.load();
	}

	/**
	 * Nobody holds the lock and it has not been acquired for
	 * longer than the given duration.
	 */
	[[gnu::pure]]
	bool IsIdle(Clock::time_point now,
		    Clock::duration threshold) const noexcept {
		return GetReaders() == 0 && GetWriters() == 0 &&
			now - GetTouched() > threshold;
	}
};
