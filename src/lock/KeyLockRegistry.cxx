// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "KeyLockRegistry.hxx"

#include <mutex>
#include <utility>
#include <vector>

std::shared_ptr<KeyLock>
KeyLockRegistry::Get(std::string_view key)
{
	{
		const std::shared_lock lock{mutex};
		if (auto i = map.find(std::string{key}); i != map.end()) {
			/* refresh while the registry lock keeps
			   SweepIdle() out */
			i->second->Touch();
			return i->second;
		}
	}

	std::string k{key};
	const std::scoped_lock lock{mutex};

	/* check again; another thread may have been faster */
	if (auto i = map.find(k); i != map.end()) {
		i->second->Touch();
		return i->second;
	}

	auto l = std::make_shared<KeyLock>(key, global_stats);
	map.emplace(std::move(k), l);
	return l;
}

std::size_t
KeyLockRegistry::size() const noexcept
{
	const std::shared_lock lock{mutex};
	return map.size();
}

std::size_t
KeyLockRegistry::SweepIdle(KeyLock::Clock::duration threshold,
			   const VisitFunction &visit)
{
	std::vector<std::pair<std::shared_ptr<KeyLock>, bool>> visited;
	std::size_t n = 0;

	{
		const std::scoped_lock lock{mutex};
		const auto now = KeyLock::Clock::now();

		if (visit)
			visited.reserve(map.size());

		for (auto i = map.begin(); i != map.end();) {
			/* an entry referenced outside the map belongs
			   to a request which has not locked it yet */
			const bool expired = i->second.use_count() == 1 &&
				i->second->IsIdle(now, threshold);

			if (visit)
				visited.emplace_back(i->second, expired);

			if (expired) {
				i = map.erase(i);
				++n;
			} else
				++i;
		}
	}

	for (const auto &[l, expired] : visited)
		visit(*l, expired);

	return n;
}
