// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <map>
#include <string>
#include <string_view>

/**
 * Request headers as received by the HTTP server.  Names are lower
 * case.
 */
using HttpHeaderMap = std::multimap<std::string, std::string, std::less<>>;

/**
 * Look up the first header with the given (lower case) name.
 *
 * @return a nulled std::string_view if there is no such header
 */
[[gnu::pure]]
inline std::string_view
GetHeader(const HttpHeaderMap &headers, std::string_view name) noexcept
{
	auto i = headers.find(name);
	if (i == headers.end())
		return {};

	return i->second;
}
