// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Logger.hxx"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class CacheStore;
class CacheStats;
class KeyLockRegistry;

struct JanitorConfig {
	/**
	 * Evict entries while there are more than this many.
	 */
	uint_least64_t max_files = 10000;

	/**
	 * Evict entries while they occupy more than this many
	 * megabytes.
	 */
	double max_size_mb = 1000;

	/**
	 * Entries older than this are always deleted; zero disables
	 * expiry.
	 */
	std::chrono::system_clock::duration max_age = std::chrono::hours{3};

	/**
	 * Enable clean passes?
	 */
	bool clean = true;

	/**
	 * Only log what would be deleted?
	 */
	bool dry_run = false;

	bool print_stats = true;

	std::chrono::steady_clock::duration tick_interval = std::chrono::seconds{60};

	/**
	 * Idle key locks are removed after this duration.
	 */
	std::chrono::steady_clock::duration lock_idle_threshold = std::chrono::minutes{10};
};

/**
 * A cache entry considered for eviction.
 */
struct EvictionCandidate {
	std::string name;

	/**
	 * Content size in megabytes.
	 */
	double size_mb;

	/**
	 * Hours since the content was written.
	 */
	double age_hours;

	/**
	 * Hours since the entry was last served.
	 */
	double used_hours;

	/**
	 * Big, old and unused entries score higher.
	 */
	double score;
};

struct EvictionDecision {
	const EvictionCandidate *candidate;

	/**
	 * The number and size of all entries up to and including
	 * this one.
	 */
	uint_least64_t running_count;
	double running_size_mb;
};

/**
 * Select the entries to be evicted: they are sorted by ascending
 * score (in place) and kept as long as both the running count and
 * the running size stay within the budgets; all others are returned.
 */
std::vector<EvictionDecision>
PlanEviction(std::vector<EvictionCandidate> &candidates,
	     uint_least64_t max_files, double max_size_mb);

/**
 * Background maintenance: periodic statistics reports, removal of
 * idle key locks and the clean pass which deletes orphaned, expired
 * and (over budget) low-value cache entries.
 */
class Janitor {
	const JanitorConfig config;

	const CacheStore &store;

	KeyLockRegistry &registry;

	const CacheStats &global_stats;

	const Logger logger;

	std::thread thread;

	std::mutex mutex;
	std::condition_variable cond;
	bool should_stop = false;

	unsigned ticks = 0;

public:
	struct CleanResult {
		unsigned orphans = 0, expired = 0, evicted = 0;

		/**
		 * The remaining files and their size (after
		 * removing orphans and expired entries, before
		 * eviction).
		 */
		uint_least64_t count = 0;
		double size_mb = 0;
	};

	Janitor(const JanitorConfig &_config, const CacheStore &_store,
		KeyLockRegistry &_registry,
		const CacheStats &_global_stats) noexcept;

	~Janitor() noexcept {
		Stop();
	}

	Janitor(const Janitor &) = delete;
	Janitor &operator=(const Janitor &) = delete;

	/**
	 * Launch the maintenance thread.  It runs a clean pass
	 * immediately (if enabled) and then ticks at the configured
	 * interval.
	 */
	void Start();

	void Stop() noexcept;

	/**
	 * One timer tick.  Called by the maintenance thread; exposed
	 * for unit tests.
	 */
	void Tick() noexcept;

	/**
	 * Scan the cache directory and delete orphaned, expired and
	 * over-budget entries.  Does not lock anything; readers with
	 * open files keep their data.
	 */
	CleanResult CleanCache() noexcept;

	/**
	 * Log per-key statistics and remove idle key locks.
	 *
	 * @return the number of removed key locks
	 */
	std::size_t SweepLocks() noexcept;

private:
	void Run() noexcept;

	void RemoveEntry(const std::string &name) const noexcept;
};
