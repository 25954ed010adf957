// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <system_error>
#include <utility>

#include <errno.h>

[[gnu::pure]]
static inline const std::error_category &
ErrnoCategory() noexcept
{
	/* on POSIX, the generic category carries errno values */
	return std::generic_category();
}

static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, ErrnoCategory(), msg);
}

static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

template<typename... Args>
static inline std::system_error
FmtErrno(int code, fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return MakeErrno(code,
			 fmt::format(format_str, std::forward<Args>(args)...).c_str());
}

template<typename... Args>
static inline std::system_error
FmtErrno(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	const int code = errno;
	return FmtErrno(code, format_str, std::forward<Args>(args)...);
}

[[gnu::pure]]
static inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}

[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT);
}
