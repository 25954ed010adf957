// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <charconv>
#include <optional>
#include <string_view>

/**
 * Parse the whole string as a decimal integer.  Returns std::nullopt
 * on syntax error, on overflow and on trailing garbage.
 */
template<typename T>
[[gnu::pure]]
std::optional<T>
ParseInteger(std::string_view src) noexcept
{
	T value;
	const char *const end = src.data() + src.size();
	auto [ptr, ec] = std::from_chars(src.data(), end, value, 10);
	if (ec != std::errc{} || ptr != end)
		return std::nullopt;

	return value;
}
