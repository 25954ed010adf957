// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CacheStats.hxx"

#include <fmt/format.h>

static constexpr auto relaxed = std::memory_order_relaxed;

void
CacheStats::Requested() noexcept
{
	requests.fetch_add(1, relaxed);

	if (parent != nullptr)
		parent->Requested();
}

void
CacheStats::Completed() noexcept
{
	completed.fetch_add(1, relaxed);

	if (parent != nullptr)
		parent->Completed();
}

void
CacheStats::Hit(uint_least64_t bytes) noexcept
{
	hits.fetch_add(1, relaxed);
	hit_bytes.fetch_add(bytes, relaxed);
	sent_bytes.fetch_add(bytes, relaxed);

	if (parent != nullptr)
		parent->Hit(bytes);
}

void
CacheStats::Miss(uint_least64_t bytes) noexcept
{
	misses.fetch_add(1, relaxed);
	miss_bytes.fetch_add(bytes, relaxed);
	sent_bytes.fetch_add(bytes, relaxed);

	if (parent != nullptr)
		parent->Miss(bytes);
}

void
CacheStats::Error(uint_least64_t bytes) noexcept
{
	errors.fetch_add(1, relaxed);
	sent_bytes.fetch_add(bytes, relaxed);

	if (parent != nullptr)
		parent->Error(bytes);
}

void
CacheStats::Disconnect() noexcept
{
	disconnects.fetch_add(1, relaxed);

	if (parent != nullptr)
		parent->Disconnect();
}

void
CacheStats::Received(uint_least64_t bytes) noexcept
{
	received_bytes.fetch_add(bytes, relaxed);

	if (parent != nullptr)
		parent->Received(bytes);
}

CacheStats::Snapshot
CacheStats::GetSnapshot() const noexcept
{
	return {
		requests.load(relaxed), completed.load(relaxed),
		disconnects.load(relaxed),
		hits.load(relaxed), hit_bytes.load(relaxed),
		misses.load(relaxed), miss_bytes.load(relaxed),
		errors.load(relaxed),
		sent_bytes.load(relaxed), received_bytes.load(relaxed),
	};
}

static constexpr double
ToMB(uint_least64_t bytes) noexcept
{
	return double(bytes) / 1024 / 1024;
}

std::string
CacheStats::FormatReport(std::string_view extra) const
{
	const auto s = GetSnapshot();

	const std::string rate = s.misses == 0
		? std::string{"∞"}
		: fmt::format("{:3.1f}×", double(s.hits) / double(s.misses));

	const double sent_mb = ToMB(s.sent_bytes);
	const double received_mb = ToMB(s.received_bytes);
	const std::string transfer_rate = s.received_bytes == 0
		? std::string{"∞"}
		: fmt::format("{:3.1f}×", sent_mb / received_mb);

	return fmt::format("{}{}\n"
			   "req: {:6}/{:<6}  {:3} dc  hit {:6}:{:<6} {:<6}  err: {}\n"
			   "sent: {:8.1f}MB  recv: {:8.1f}MB {}",
			   name, extra,
			   s.completed, s.requests, s.disconnects,
			   s.hits, s.misses, rate,
			   s.errors,
			   sent_mb, received_mb, transfer_rate);
}
