// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>
#include <utility>

/**
 * Split the string at the first occurrence of the given character.
 * If the character is not found, then the first value is the whole
 * string and the second value is a nulled std::string_view.
 */
[[gnu::pure]]
constexpr std::pair<std::string_view, std::string_view>
Split(std::string_view haystack, char ch) noexcept
{
	const auto i = haystack.find(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}

/**
 * Like Split(), but split at the last occurrence.
 */
[[gnu::pure]]
constexpr std::pair<std::string_view, std::string_view>
SplitLast(std::string_view haystack, char ch) noexcept
{
	const auto i = haystack.rfind(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}
