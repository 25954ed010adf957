// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Janitor.hxx"
#include "Store.hxx"
#include "io/DirectoryReader.hxx"
#include "lock/KeyLockRegistry.hxx"
#include "stats/CacheStats.hxx"

#include <algorithm>

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

std::vector<EvictionDecision>
PlanEviction(std::vector<EvictionCandidate> &candidates,
	     uint_least64_t max_files, double max_size_mb)
{
	std::sort(candidates.begin(), candidates.end(),
		  [](const auto &a, const auto &b){
			  return a.score < b.score;
		  });

	std::vector<EvictionDecision> result;

	uint_least64_t count = 0;
	double size_mb = 0;
	for (const auto &i : candidates) {
		++count;
		size_mb += i.size_mb;

		if (count > max_files || size_mb > max_size_mb)
			result.push_back({&i, count, size_mb});
	}

	return result;
}

Janitor::Janitor(const JanitorConfig &_config, const CacheStore &_store,
		 KeyLockRegistry &_registry,
		 const CacheStats &_global_stats) noexcept
	:config(_config), store(_store), registry(_registry),
	 global_stats(_global_stats),
	 logger("janitor")
{
}

void
Janitor::Start()
{
	thread = std::thread{[this]{ Run(); }};
}

void
Janitor::Stop() noexcept
{
	{
		const std::scoped_lock lock{mutex};
		should_stop = true;
		cond.notify_all();
	}

	if (thread.joinable())
		thread.join();
}

void
Janitor::Run() noexcept
{
	if (config.clean)
		CleanCache();

	auto next = std::chrono::steady_clock::now();

	std::unique_lock lock{mutex};
	while (true) {
		next += config.tick_interval;
		if (cond.wait_until(lock, next, [this]{ return should_stop; }))
			break;

		lock.unlock();
		Tick();
		lock.lock();
	}
}

void
Janitor::Tick() noexcept
{
	++ticks;

	if (ticks % 10 == 0)
		SweepLocks();

	if (ticks % 60 == 0 && config.clean)
		CleanCache();

	if (config.print_stats)
		logger(2, global_stats.FormatReport());
}

std::size_t
Janitor::SweepLocks() noexcept
try {
	KeyLockRegistry::VisitFunction report;
	if (config.print_stats)
		report = [this](const KeyLock &l, bool expired){
			logger(2, l.stats.FormatReport(expired ? " (expired)"sv : ""sv));
		};

	return registry.SweepIdle(config.lock_idle_threshold, report);
} catch (...) {
	logger(1, "Failed to sweep key locks: ", std::current_exception());
	return 0;
}

void
Janitor::RemoveEntry(const std::string &name) const noexcept
{
	store.Remove(name);
}

[[gnu::pure]]
static double
HoursSince(std::chrono::system_clock::time_point now,
	   const struct timespec &ts) noexcept
{
	const auto t = std::chrono::system_clock::time_point{
		std::chrono::duration_cast<std::chrono::system_clock::duration>(
			std::chrono::seconds{ts.tv_sec} +
			std::chrono::nanoseconds{ts.tv_nsec})};

	return std::chrono::duration<double, std::chrono::hours::period>(now - t).count();
}

Janitor::CleanResult
Janitor::CleanCache() noexcept
try {
	logger(2, "cleaning cache");

	CleanResult result;

	DirectoryReader dir{store.GetDirectory().c_str()};
	const FileDescriptor dir_fd = dir.GetFileDescriptor();

	const auto now = std::chrono::system_clock::now();
	const double max_age_hours =
		std::chrono::duration<double, std::chrono::hours::period>(config.max_age).count();

	std::vector<EvictionCandidate> candidates;

	while (const char *name = dir.Read()) {
		const std::string_view name_sv{name};
		if (name_sv.ends_with(".meta"sv))
			continue;

		struct stat st;
		if (fstatat(dir_fd.Get(), name, &st, AT_SYMLINK_NOFOLLOW) < 0) {
			logger.Fmt(2, "error reading file info {}: {}",
				   name, strerror(errno));
			continue;
		}

		if (!S_ISREG(st.st_mode))
			continue;

		const std::string name_s{name};
		const double size_mb = double(st.st_size) / 1024 / 1024;
		const double age = HoursSince(now, st.st_mtim);

		const std::string meta_name = name_s + ".meta";
		struct stat meta_st;
		if (fstatat(dir_fd.Get(), meta_name.c_str(), &meta_st, 0) < 0) {
			logger.Fmt(2, "error reading meta info {}: {}",
				   meta_name, strerror(errno));
			++result.orphans;
			if (!config.dry_run)
				RemoveEntry(name_s);
			continue;
		}

		if (config.max_age > config.max_age.zero() && age > max_age_hours) {
			logger.Fmt(2, "{} {}\n  (age: {:.1f}h > {:.1f}h)",
				   config.dry_run ? "would remove" : "removing",
				   name_s, age, max_age_hours);
			++result.expired;
			if (!config.dry_run)
				RemoveEntry(name_s);
			continue;
		}

		const double used = HoursSince(now, meta_st.st_mtim);

		candidates.push_back({
			name_s, size_mb, age, used,
			size_mb * age * used,
		});

		++result.count;
		result.size_mb += size_mb;
	}

	logger.Fmt(2, "cache size: {:.1f}/{:.1f}Mb ({}/{} files)",
		   result.size_mb, config.max_size_mb,
		   result.count, config.max_files);

	if (result.count <= config.max_files &&
	    result.size_mb <= config.max_size_mb)
		return result;

	for (const auto &i : PlanEviction(candidates, config.max_files,
					  config.max_size_mb)) {
		const auto &file = *i.candidate;

		logger.Fmt(2, "{} {}\n"
			   "  age: {:.1f}h size: {:.1f}Mb  used: {:.1f}h\n"
			   "  ({} > {} files / {:.1f} > {:.1f}Mb, score: {:.3f})",
			   config.dry_run ? "would remove" : "removing",
			   file.name,
			   file.age_hours, file.size_mb, file.used_hours,
			   i.running_count, config.max_files,
			   i.running_size_mb, config.max_size_mb,
			   file.score);

		++result.evicted;
		if (!config.dry_run)
			RemoveEntry(file.name);
	}

	return result;
} catch (...) {
	logger(1, "error cleaning cache: ", std::current_exception());
	return {};
}
