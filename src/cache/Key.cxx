// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Key.hxx"
#include "lib/sodium/UrlSafeBase64SHA256.hxx"
#include "uri/Escape.hxx"

using std::string_view_literals::operator""sv;

bool
IsValidCacheKey(std::string_view key, bool hash_keys) noexcept
{
	if (key.empty())
		return false;

	if (key.find(".."sv) != key.npos || key.find('~') != key.npos)
		return false;

	if (!hash_keys) {
		/* the key is used as file name */
		if (key.find('/') != key.npos || key.find('\0') != key.npos ||
		    key.ends_with(".meta"sv))
			return false;
	}

	return true;
}

std::string
CacheKeyToFileName(std::string_view key, bool hash_keys) noexcept
{
	if (hash_keys)
		return UrlSafeBase64SHA256(key);

	return std::string{key};
}

std::optional<CacheKey>
MakeCacheKey(std::string_view path, std::string_view query,
	     const CacheKeyOptions &options)
{
	if (!path.starts_with(options.prefix))
		return std::nullopt;

	path.remove_prefix(options.prefix.size());

	auto key = UriUnescape(path);
	if (!key)
		return std::nullopt;

	if (options.key_query && !query.empty()) {
		key->push_back('?');
		key->append(query);
	}

	if (!IsValidCacheKey(*key, options.hash_keys))
		return std::nullopt;

	CacheKey result;
	result.name = CacheKeyToFileName(*key, options.hash_keys);
	result.key = std::move(*key);
	result.fetch_path = path;
	return result;
}
