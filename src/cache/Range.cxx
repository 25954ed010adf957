// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Range.hxx"
#include "util/NumberParser.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

std::optional<HttpByteRange>
ParseRangeHeader(std::string_view header, uint_least64_t size)
{
	header = Strip(header);
	if (header.empty())
		return std::nullopt;

	if (header.starts_with("bytes="sv))
		header.remove_prefix(6);

	const auto [start_string, end_string] = Split(header, '-');
	if (end_string.data() == nullptr ||
	    end_string.find('-') != end_string.npos)
		throw InvalidRangeError("invalid range format");

	if (start_string.empty()) {
		/* suffix range: the last N bytes */
		const auto suffix = ParseInteger<uint_least64_t>(end_string);
		if (!suffix)
			throw InvalidRangeError("invalid end value");

		if (*suffix == 0 || size == 0)
			throw InvalidRangeError("invalid range: start > end");

		const uint_least64_t length = std::min(*suffix, size);
		return HttpByteRange{size - length, size - 1};
	}

	const auto start = ParseInteger<uint_least64_t>(start_string);
	if (!start)
		throw InvalidRangeError("invalid start value");

	if (size == 0)
		/* nothing can be satisfied */
		throw InvalidRangeError("invalid range: start > end");

	uint_least64_t end = size - 1;
	if (!end_string.empty()) {
		const auto e = ParseInteger<uint_least64_t>(end_string);
		if (!e)
			throw InvalidRangeError("invalid end value");

		end = std::min(*e, end);
	}

	if (*start > end)
		throw InvalidRangeError("invalid range: start > end");

	return HttpByteRange{*start, end};
}
