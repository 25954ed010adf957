// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Escape.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>

static constexpr int
ParseHexDigit(char ch) noexcept
{
	if (IsDigitASCII(ch))
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

std::optional<std::string>
UriUnescape(std::string_view src, char escape_char)
{
	std::string dest;
	dest.reserve(src.size());

	auto i = src.begin();
	const auto end = src.end();

	while (true) {
		auto p = std::find(i, end, escape_char);
		dest.append(i, p);

		if (p == end)
			break;

		if (end - p < 3)
			/* percent sign at the end of string */
			return std::nullopt;

		const int digit1 = ParseHexDigit(p[1]);
		const int digit2 = ParseHexDigit(p[2]);
		if (digit1 == -1 || digit2 == -1)
			/* invalid hex digits */
			return std::nullopt;

		dest.push_back((char)((digit1 << 4) | digit2));
		i = p + 3;
	}

	return dest;
}
