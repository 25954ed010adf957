// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <utility>

template<typename... Args>
static inline std::runtime_error
FmtRuntimeError(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return std::runtime_error{fmt::format(format_str, std::forward<Args>(args)...)};
}

template<typename... Args>
static inline std::invalid_argument
FmtInvalidArgument(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return std::invalid_argument{fmt::format(format_str, std::forward<Args>(args)...)};
}
