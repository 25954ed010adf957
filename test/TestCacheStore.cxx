// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "cache/Store.hxx"
#include "system/Error.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <array>

#include <fcntl.h>
#include <sys/stat.h>

using std::string_view_literals::operator""sv;

static CacheMetadata
MakeMetadata(std::chrono::system_clock::time_point retrieved,
	     int_least64_t size)
{
	CacheMetadata m;
	m.source = "http://origin/foo";
	m.content_type = "text/plain";
	m.retrieved = retrieved;
	m.size = size;
	return m;
}

static std::string
ReadAll(FileDescriptor fd)
{
	std::string result;
	std::array<std::byte, 4096> buffer;
	off_t offset = 0;

	while (true) {
		const ssize_t nbytes = fd.ReadAt(offset, buffer);
		if (nbytes < 0)
			throw MakeErrno("Failed to read");
		if (nbytes == 0)
			break;

		result.append(ToStringView(std::span{buffer}.first(nbytes)));
		offset += nbytes;
	}

	return result;
}

TEST(CacheStore, WriteAndOpen)
{
	const TempDirectory dir;
	const CacheStore store{dir.GetPath()};

	EXPECT_FALSE(store.Exists("foo"sv));

	const auto now = std::chrono::system_clock::now();
	store.Write("foo"sv, MakeMetadata(now, 5), AsBytes("hello"sv));

	EXPECT_TRUE(store.Exists("foo"sv));
	EXPECT_EQ(dir.CountFiles(), 2u);

	auto entry = store.Open("foo"sv);
	EXPECT_EQ(entry.metadata.source, "http://origin/foo");
	EXPECT_EQ(entry.metadata.size, 5);
	EXPECT_EQ(ReadAll(entry.content), "hello");

	store.Remove("foo"sv);
	EXPECT_FALSE(store.Exists("foo"sv));
	EXPECT_EQ(dir.CountFiles(), 0u);

	/* removing twice is harmless */
	store.Remove("foo"sv);
}

TEST(CacheStore, OpenMissing)
{
	const TempDirectory dir;
	const CacheStore store{dir.GetPath()};

	try {
		store.Open("missing"sv);
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsFileNotFound(e));
	}
}

TEST(CacheStore, ContentWithoutMetadata)
{
	const TempDirectory dir;
	const CacheStore store{dir.GetPath()};

	{
		auto writer = store.BeginWrite("foo"sv);
		writer.Append(AsBytes("partial"sv));
		EXPECT_EQ(writer.GetSize(), 7u);

		/* without metadata the entry does not exist; the
		   content file has no name yet */
		EXPECT_FALSE(store.Exists("foo"sv));
		EXPECT_EQ(dir.CountFiles(), writer.IsAnonymous() ? 0u : 1u);
	}

	/* the writer was destroyed without Commit() */
	EXPECT_EQ(dir.CountFiles(), 0u);
}

TEST(CacheStore, Commit)
{
	const TempDirectory dir;
	const CacheStore store{dir.GetPath()};

	{
		auto writer = store.BeginWrite("foo"sv);
		writer.Append(AsBytes("abc"sv));
		writer.Append(AsBytes("def"sv));
		writer.Commit(MakeMetadata(std::chrono::system_clock::now(),
					   int_least64_t(writer.GetSize())));
	}

	ASSERT_TRUE(store.Exists("foo"sv));
	EXPECT_EQ(store.ReadMetadata("foo"sv).size, 6);
	EXPECT_EQ(ReadAll(store.Open("foo"sv).content), "abcdef");
}

TEST(CacheStore, IsStale)
{
	using namespace std::chrono;

	const TempDirectory dir;
	const CacheStore store{dir.GetPath()};

	const auto now = system_clock::now();
	store.Write("fresh"sv, MakeMetadata(now - minutes{10}, 0), {});
	store.Write("old"sv, MakeMetadata(now - hours{4}, 0), {});

	EXPECT_FALSE(store.IsStale("fresh"sv, hours{3}));
	EXPECT_TRUE(store.IsStale("old"sv, hours{3}));

	/* zero disables expiry */
	EXPECT_FALSE(store.IsStale("old"sv, system_clock::duration::zero()));

	/* unreadable metadata is stale */
	EXPECT_TRUE(store.IsStale("missing"sv, hours{3}));
}

TEST(CacheStore, Touch)
{
	const TempDirectory dir;
	const CacheStore store{dir.GetPath()};

	store.Write("foo"sv, MakeMetadata(std::chrono::system_clock::now(), 0), {});

	const auto path = store.GetMetadataPath("foo"sv);

	/* backdate the metadata file */
	const struct timespec old_times[2] = {{1000, 0}, {1000, 0}};
	ASSERT_EQ(utimensat(AT_FDCWD, path.c_str(), old_times, 0), 0);

	store.Touch("foo"sv);

	struct stat st;
	ASSERT_EQ(stat(path.c_str(), &st), 0);
	EXPECT_GT(st.st_mtim.tv_sec, 1000);

	EXPECT_THROW(store.Touch("missing"sv), std::system_error);
}

TEST(CacheStore, CreateDirectory)
{
	const TempDirectory dir;
	const CacheStore store{dir.GetPath() + "/sub"};

	store.CreateDirectory();
	/* again; it exists already */
	store.CreateDirectory();

	store.Write("foo"sv, MakeMetadata(std::chrono::system_clock::now(), 0), {});
	EXPECT_TRUE(store.Exists("foo"sv));

	store.Remove("foo"sv);
	rmdir((dir.GetPath() + "/sub").c_str());
}
