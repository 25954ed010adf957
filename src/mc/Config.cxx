// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/NumberParser.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

#include <stdexcept>

#include <stdlib.h>

using std::string_view_literals::operator""sv;

bool
ParseBool(std::string_view s)
{
	if (s == "1"sv || s == "t"sv || s == "T"sv ||
	    s == "TRUE"sv || s == "true"sv || s == "True"sv)
		return true;

	if (s == "0"sv || s == "f"sv || s == "F"sv ||
	    s == "FALSE"sv || s == "false"sv || s == "False"sv)
		return false;

	throw std::invalid_argument("Not a boolean");
}

static uint_least64_t
ParseUnsigned(std::string_view s)
{
	const auto value = ParseInteger<uint_least64_t>(s);
	if (!value)
		throw std::invalid_argument("Not a non-negative integer");

	return *value;
}

static std::vector<std::string>
ParseUpstreams(std::string_view s)
{
	std::vector<std::string> result;

	while (!s.empty()) {
		auto [value, rest] = Split(s, ' ');
		s = rest;

		value = Strip(value);
		if (!value.empty())
			result.emplace_back(value);
	}

	return result;
}

/**
 * Invoke the function with the value of the variable if it is set;
 * exceptions are wrapped in a message naming the variable.
 */
template<typename F>
static void
WithVariable(const EnvironmentLookup &getenv, const char *name, F &&f)
{
	const char *value = getenv(name);
	if (value == nullptr)
		return;

	try {
		f(std::string_view{value});
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("invalid value for {}: \"{}\"",
						       name, value));
	}
}

static void
LoadString(const EnvironmentLookup &getenv, const char *name,
	   std::string &dest)
{
	WithVariable(getenv, name, [&dest](std::string_view value){
		dest = value;
	});
}

static void
LoadBool(const EnvironmentLookup &getenv, const char *name, bool &dest)
{
	WithVariable(getenv, name, [&dest](std::string_view value){
		dest = ParseBool(value);
	});
}

void
LoadEnvironment(McConfig &config, const EnvironmentLookup &getenv)
{
	LoadString(getenv, "CACHE_LISTEN", config.listen);
	LoadString(getenv, "CACHE_DIR", config.cache_dir);

	WithVariable(getenv, "CACHE_UPSTREAM", [&config](std::string_view value){
		config.upstreams = ParseUpstreams(value);
		if (config.upstreams.empty())
			throw std::invalid_argument("No upstream");
	});

	LoadString(getenv, "CACHE_PREFIX", config.key.prefix);

	static constexpr struct {
		unsigned status;
		const char *name;
	} replies[] = {
		{403, "CACHE_REPLY_403"},
		{404, "CACHE_REPLY_404"},
		{500, "CACHE_REPLY_500"},
		{503, "CACHE_REPLY_503"},
		{504, "CACHE_REPLY_504"},
	};

	for (const auto &i : replies)
		WithVariable(getenv, i.name, [&config, &i](std::string_view value){
			if (value.empty())
				config.canned_replies.erase(i.status);
			else
				config.canned_replies.insert_or_assign(i.status,
								       std::string{value});
		});

	LoadBool(getenv, "CACHE_PRINT_STATS", config.janitor.print_stats);

	WithVariable(getenv, "CACHE_MAX_FILES", [&config](std::string_view value){
		config.janitor.max_files = ParseUnsigned(value);
	});

	WithVariable(getenv, "CACHE_MAX_SIZE_MB", [&config](std::string_view value){
		config.janitor.max_size_mb = ParseUnsigned(value);
	});

	WithVariable(getenv, "CACHE_MAX_AGE_HOURS", [&config](std::string_view value){
		config.janitor.max_age = std::chrono::hours(ParseUnsigned(value));
	});

	LoadBool(getenv, "CACHE_CLEAN", config.janitor.clean);
	LoadBool(getenv, "CACHE_DRY_RUN", config.janitor.dry_run);
	LoadBool(getenv, "CACHE_KEY_QUERY", config.key.key_query);
	LoadBool(getenv, "CACHE_HASH_KEYS", config.key.hash_keys);

	WithVariable(getenv, "CACHE_WORKERS", [&config](std::string_view value){
		const auto n = ParseUnsigned(value);
		if (n < 1 || n > 4096)
			throw std::invalid_argument("Out of range");
		config.workers = n;
	});
}

void
LoadEnvironment(McConfig &config)
{
	LoadEnvironment(config, [](const char *name){
		return static_cast<const char *>(getenv(name));
	});
}

void
Check(const McConfig &config)
{
	if (config.listen.empty())
		throw std::runtime_error("No listener configured");

	if (config.cache_dir.empty())
		throw std::runtime_error("No cache directory configured");

	if (config.upstreams.empty())
		throw std::runtime_error("No upstream configured");

	if (config.key.prefix.empty() || config.key.prefix.front() != '/')
		throw std::runtime_error("CACHE_PREFIX must begin with a slash");
}
