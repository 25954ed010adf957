// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Leveled logging to stderr.  Level 1 is for errors, level 2 for
 * warnings and important notices, level 3 for informational
 * messages, higher levels are for debugging.
 */

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

class LoggerDetail {
	static unsigned max_level;

public:
	static void SetLevel(unsigned level) noexcept {
		max_level = level;
	}

	[[gnu::pure]]
	static bool CheckLevel(unsigned level) noexcept {
		return level <= max_level;
	}

	static void WriteV(std::string_view domain,
			   std::string_view message) noexcept;

	static void Append(std::string &buffer, std::string_view s) noexcept {
		buffer.append(s);
	}

	static void Append(std::string &buffer, const char *s) noexcept {
		buffer.append(s != nullptr ? s : "(null)");
	}

	static void Append(std::string &buffer, const std::string &s) noexcept {
		buffer.append(s);
	}

	static void Append(std::string &buffer, char ch) noexcept {
		buffer.push_back(ch);
	}

	static void Append(std::string &buffer, std::exception_ptr ep) noexcept;

	template<typename T>
	static void Append(std::string &buffer, const T &value) noexcept {
		fmt::format_to(std::back_inserter(buffer), "{}", value);
	}

	template<typename... Params>
	static void Concat(unsigned level, std::string_view domain,
			   Params&&... params) noexcept {
		if (!CheckLevel(level))
			return;

		std::string buffer;
		(Append(buffer, std::forward<Params>(params)), ...);
		WriteV(domain, buffer);
	}

	template<typename... Args>
	static void Fmt(unsigned level, std::string_view domain,
			fmt::format_string<Args...> format_str,
			Args&&... args) noexcept {
		if (!CheckLevel(level))
			return;

		WriteV(domain, fmt::format(format_str,
					   std::forward<Args>(args)...));
	}
};

static inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::SetLevel(level);
}

[[gnu::pure]]
static inline bool
CheckLogLevel(unsigned level) noexcept
{
	return LoggerDetail::CheckLevel(level);
}

template<typename... Params>
static inline void
LogConcat(unsigned level, std::string_view domain, Params&&... params) noexcept
{
	LoggerDetail::Concat(level, domain, std::forward<Params>(params)...);
}

template<typename... Args>
static inline void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	LoggerDetail::Fmt(level, domain, format_str,
			  std::forward<Args>(args)...);
}

/**
 * A logger with a fixed domain which is prepended to each message.
 */
class Logger {
	std::string domain;

public:
	Logger() = default;

	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	std::string_view GetDomain() const noexcept {
		return domain;
	}

	template<typename... Params>
	void operator()(unsigned level, Params&&... params) const noexcept {
		LoggerDetail::Concat(level, domain,
				     std::forward<Params>(params)...);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, domain, format_str,
				  std::forward<Args>(args)...);
	}
};
