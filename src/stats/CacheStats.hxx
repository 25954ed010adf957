// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * Monotonic request counters for one cache key (or for the whole
 * process).  A per-key record has a parent (the global record) to
 * which each event is forwarded at the moment it happens.
 *
 * All methods are thread-safe.
 */
class CacheStats {
	const std::string name;

	CacheStats *const parent;

	std::atomic<uint_least64_t> requests{0}, completed{0};
	std::atomic<uint_least64_t> disconnects{0};
	std::atomic<uint_least64_t> hits{0}, hit_bytes{0};
	std::atomic<uint_least64_t> misses{0}, miss_bytes{0};
	std::atomic<uint_least64_t> errors{0};
	std::atomic<uint_least64_t> sent_bytes{0}, received_bytes{0};

public:
	struct Snapshot {
		uint_least64_t requests, completed;
		uint_least64_t disconnects;
		uint_least64_t hits, hit_bytes;
		uint_least64_t misses, miss_bytes;
		uint_least64_t errors;
		uint_least64_t sent_bytes, received_bytes;
	};

	explicit CacheStats(std::string_view _name,
			    CacheStats *_parent=nullptr) noexcept
		:name(_name), parent(_parent) {}

	CacheStats(const CacheStats &) = delete;
	CacheStats &operator=(const CacheStats &) = delete;

	const std::string &GetName() const noexcept {
		return name;
	}

	void Requested() noexcept;
	void Completed() noexcept;

	/**
	 * A request was served from the cache.
	 */
	void Hit(uint_least64_t bytes) noexcept;

	/**
	 * A request was served after fetching from an origin.
	 */
	void Miss(uint_least64_t bytes) noexcept;

	void Error(uint_least64_t bytes) noexcept;

	/**
	 * The client went away during the response.  The request is
	 * still counted as hit or miss (with the bytes that were
	 * sent).
	 */
	void Disconnect() noexcept;

	/**
	 * Bytes were received from an origin.
	 */
	void Received(uint_least64_t bytes) noexcept;

	[[gnu::pure]]
	Snapshot GetSnapshot() const noexcept;

	/**
	 * Format a human-readable report.
	 *
	 * @param extra a string appended to the name
	 */
	std::string FormatReport(std::string_view extra={}) const;
};
