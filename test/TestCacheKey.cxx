// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "cache/Key.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(CacheKey, Hashed)
{
	const CacheKeyOptions options;

	const auto key = MakeCacheKey("/media/foo%20bar.png"sv, {}, options);
	ASSERT_TRUE(key);
	EXPECT_EQ(key->key, "media/foo bar.png");
	EXPECT_EQ(key->fetch_path, "media/foo%20bar.png");

	/* URL-safe base64 of SHA-256 without padding */
	EXPECT_EQ(key->name.size(), 43u);
	EXPECT_EQ(key->name.find_first_of("+/="), std::string::npos);

	/* deterministic */
	EXPECT_EQ(key->name, CacheKeyToFileName("media/foo bar.png"sv, true));
	EXPECT_NE(key->name, CacheKeyToFileName("media/foo bar.jpg"sv, true));
}

TEST(CacheKey, Query)
{
	CacheKeyOptions options;

	auto key = MakeCacheKey("/a.png"sv, "size=small"sv, options);
	ASSERT_TRUE(key);
	EXPECT_EQ(key->key, "a.png?size=small");
	EXPECT_EQ(key->fetch_path, "a.png");

	/* an empty query is no query */
	key = MakeCacheKey("/a.png"sv, ""sv, options);
	ASSERT_TRUE(key);
	EXPECT_EQ(key->key, "a.png");

	options.key_query = false;
	key = MakeCacheKey("/a.png"sv, "size=small"sv, options);
	ASSERT_TRUE(key);
	EXPECT_EQ(key->key, "a.png");
}

TEST(CacheKey, Prefix)
{
	CacheKeyOptions options;
	options.prefix = "/media/";

	auto key = MakeCacheKey("/media/a.png"sv, {}, options);
	ASSERT_TRUE(key);
	EXPECT_EQ(key->key, "a.png");
	EXPECT_EQ(key->fetch_path, "a.png");

	EXPECT_FALSE(MakeCacheKey("/other/a.png"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/media"sv, {}, options));
}

TEST(CacheKey, Invalid)
{
	const CacheKeyOptions options;

	EXPECT_FALSE(MakeCacheKey("/"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/../etc/passwd"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/%2e%2e/etc/passwd"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/~root"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/foo%zz"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/foo%2"sv, {}, options));
}

TEST(CacheKey, Plain)
{
	CacheKeyOptions options;
	options.hash_keys = false;

	const auto key = MakeCacheKey("/a.png"sv, {}, options);
	ASSERT_TRUE(key);
	EXPECT_EQ(key->name, "a.png");

	EXPECT_FALSE(MakeCacheKey("/dir/a.png"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/dir%2Fa.png"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/a.png.meta"sv, {}, options));
	EXPECT_FALSE(MakeCacheKey("/a%00b"sv, {}, options));

	/* slashes are fine when the key is hashed */
	EXPECT_TRUE(IsValidCacheKey("dir/a.png"sv, true));
	EXPECT_FALSE(IsValidCacheKey("dir/a.png"sv, false));
}
