// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Conditions.hxx"
#include "http/Date.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>
#include <stdexcept>

using std::string_view_literals::operator""sv;

bool
CacheConditions::MatchesETag(std::string_view etag) const noexcept
{
	return std::find(etags.begin(), etags.end(), etag) != etags.end();
}

std::vector<std::string>
ParseETagList(std::string_view value)
{
	std::vector<std::string> result;

	const bool weak = value.starts_with("W/"sv);
	if (weak)
		value.remove_prefix(2);

	while (!value.empty()) {
		auto [tag, rest] = Split(value, ',');
		value = rest;

		tag = Strip(tag);
		if (tag.empty())
			continue;

		std::string &s = weak
			? result.emplace_back("W/")
			: result.emplace_back();
		s.append(tag);
	}

	return result;
}

CacheConditions
ParseCacheConditions(const HttpHeaderMap &headers)
{
	CacheConditions c;

	if (const auto ims = GetHeader(headers, "if-modified-since"sv);
	    !ims.empty()) {
		c.if_modified_since = http_date_parse(Strip(ims));
		if (http_date_is_error(c.if_modified_since))
			throw std::invalid_argument("Malformed If-Modified-Since header");
	}

	if (const auto inm = GetHeader(headers, "if-none-match"sv);
	    !inm.empty())
		c.etags = ParseETagList(inm);

	return c;
}
