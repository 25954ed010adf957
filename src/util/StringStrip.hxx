// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CharUtil.hxx"

#include <string_view>

[[gnu::pure]]
constexpr std::string_view
StripLeft(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.front()))
		s.remove_prefix(1);
	return s;
}

[[gnu::pure]]
constexpr std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.back()))
		s.remove_suffix(1);
	return s;
}

[[gnu::pure]]
constexpr std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
