// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "KeyLock.hxx"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * Maps cache keys to #KeyLock instances which are created lazily.
 * The registry's own lock guards only the map.
 */
class KeyLockRegistry {
	CacheStats &global_stats;

	mutable std::shared_mutex mutex;

	std::unordered_map<std::string, std::shared_ptr<KeyLock>> map;

public:
	explicit KeyLockRegistry(CacheStats &_global_stats) noexcept
		:global_stats(_global_stats) {}

	KeyLockRegistry(const KeyLockRegistry &) = delete;
	KeyLockRegistry &operator=(const KeyLockRegistry &) = delete;

	/**
	 * Look up the lock for the given key, creating it if it does
	 * not exist yet.  As long as the returned reference exists,
	 * SweepIdle() will not remove the entry.
	 */
	std::shared_ptr<KeyLock> Get(std::string_view key);

	/**
	 * Look up (or create) the lock and acquire it in shared mode.
	 * Release with KeyLock::unlock_shared().
	 */
	std::shared_ptr<KeyLock> AcquireShared(std::string_view key) {
		auto l = Get(key);
		l->lock_shared();
		return l;
	}

	/**
	 * Look up (or create) the lock and acquire it in exclusive
	 * mode.  Release with KeyLock::unlock().
	 */
	std::shared_ptr<KeyLock> AcquireExclusive(std::string_view key) {
		auto l = Get(key);
		l->lock();
		return l;
	}

	std::size_t size() const noexcept;

	/**
	 * Callback for SweepIdle(): invoked for each entry (after the
	 * registry lock has been released); "expired" is true if the
	 * entry was removed.
	 */
	using VisitFunction = std::function<void(const KeyLock &lock,
						 bool expired)>;

	/**
	 * Remove all entries which are idle (see KeyLock::IsIdle())
	 * and not referenced by anybody else.
	 *
	 * @return the number of removed entries
	 */
	std::size_t SweepIdle(KeyLock::Clock::duration threshold,
			      const VisitFunction &visit=nullptr);
};
