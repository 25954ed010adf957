// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"

McInstance::McInstance(const McConfig &_config) noexcept
	:config(_config),
	 logger("cache"),
	 store(config.cache_dir),
	 fetcher(store, config.upstreams, config.fetch_timeout),
	 responder(store, config.canned_replies),
	 janitor(config.janitor, store, registry, global_stats)
{
}
