// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Store.hxx"
#include "io/FileDescriptor.hxx"
#include "system/Error.hxx"
#include "util/SpanCast.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <errno.h>

static std::string
ReadFile(const char *path)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path))
		throw FmtErrno("Failed to open {}", path);

	std::string result;

	while (true) {
		char buffer[4096];
		ssize_t nbytes = fd.Read(std::as_writable_bytes(std::span{buffer}));
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", path);

		if (nbytes == 0)
			break;

		result.append(buffer, nbytes);
	}

	return result;
}

static void
WriteFile(const char *path, std::string_view contents)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_WRONLY|O_CREAT|O_TRUNC, 0644))
		throw FmtErrno("Failed to create {}", path);

	fd.FullWrite(AsBytes(contents));
}

CacheEntryWriter::CacheEntryWriter(const CacheStore &_store,
				   std::string_view _name)
	:store(_store), name(_name)
{
	anonymous = fd.Open(store.GetDirectory().c_str(),
			    O_TMPFILE|O_WRONLY, 0644);
	if (anonymous)
		return;

	if (errno != EOPNOTSUPP && errno != EISDIR)
		throw FmtErrno("Failed to create temporary file in {}",
			       store.GetDirectory());

	const auto path = store.GetContentPath(name);
	if (!fd.Open(path.c_str(), O_WRONLY|O_CREAT|O_TRUNC, 0644))
		throw FmtErrno("Failed to create {}", path);
}

CacheEntryWriter::~CacheEntryWriter() noexcept
{
	if (!committed) {
		fd.Close();
		store.Remove(name);
	}
}

void
CacheEntryWriter::Append(std::span<const std::byte> src)
{
	fd.FullWrite(src);
	size += src.size();
}

void
CacheEntryWriter::Commit(const CacheMetadata &metadata)
{
	const auto path = store.GetContentPath(name);

	WriteFile(store.GetMetadataPath(name).c_str(),
		  SerializeCacheMetadata(metadata));

	if (anonymous) {
		/* a leftover from a crashed process would make
		   linkat() fail */
		if (unlink(path.c_str()) < 0 && errno != ENOENT)
			throw FmtErrno("Failed to delete {}", path);

		const auto proc_path = fmt::format("/proc/self/fd/{}", fd.Get());
		if (linkat(AT_FDCWD, proc_path.c_str(), AT_FDCWD, path.c_str(),
			   AT_SYMLINK_FOLLOW) < 0)
			throw FmtErrno("Failed to create {}", path);
	}

	if (!fd.Close())
		throw FmtErrno("Failed to close {}", path);

	committed = true;
}

void
CacheStore::CreateDirectory() const
{
	for (std::size_t i = 1; i <= directory.size(); ++i) {
		if (i < directory.size() && directory[i] != '/')
			continue;

		const std::string path = directory.substr(0, i);
		if (mkdir(path.c_str(), 0777) < 0 && errno != EEXIST)
			throw FmtErrno("Failed to create directory {}", path);
	}

	struct stat st;
	if (stat(directory.c_str(), &st) < 0)
		throw FmtErrno("Failed to access {}", directory);

	if (!S_ISDIR(st.st_mode))
		throw FmtErrno(ENOTDIR, "Not a directory: {}", directory);
}

std::string
CacheStore::GetContentPath(std::string_view name) const noexcept
{
	std::string path = directory;
	path.push_back('/');
	path.append(name);
	return path;
}

std::string
CacheStore::GetMetadataPath(std::string_view name) const noexcept
{
	std::string path = GetContentPath(name);
	path.append(".meta");
	return path;
}

static bool
IsRegularFile(const char *path) noexcept
{
	struct stat st;
	return stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

bool
CacheStore::Exists(std::string_view name) const noexcept
{
	return IsRegularFile(GetMetadataPath(name).c_str()) &&
		IsRegularFile(GetContentPath(name).c_str());
}

bool
CacheStore::IsStale(std::string_view name,
		    std::chrono::system_clock::duration max_age) const noexcept
{
	CacheMetadata metadata;

	try {
		metadata = ReadMetadata(name);
	} catch (const std::exception &) {
		/* unreadable metadata is treated like an expired
		   entry, so it gets replaced */
		return true;
	}

	return max_age > max_age.zero() &&
		std::chrono::system_clock::now() - metadata.retrieved > max_age;
}

CacheMetadata
CacheStore::ReadMetadata(std::string_view name) const
{
	return ParseCacheMetadata(ReadFile(GetMetadataPath(name).c_str()));
}

CacheEntry
CacheStore::Open(std::string_view name) const
{
	CacheEntry entry;
	entry.metadata = ReadMetadata(name);

	const auto path = GetContentPath(name);
	if (!entry.content.OpenReadOnly(path.c_str()))
		throw FmtErrno("Failed to open {}", path);

	return entry;
}

void
CacheStore::Write(std::string_view name, const CacheMetadata &metadata,
		  std::span<const std::byte> content) const
{
	auto w = BeginWrite(name);
	w.Append(content);
	w.Commit(metadata);
}

void
CacheStore::Touch(std::string_view name) const
{
	const auto path = GetMetadataPath(name);
	if (utimensat(AT_FDCWD, path.c_str(), nullptr, 0) < 0)
		throw FmtErrno("Failed to touch {}", path);
}

void
CacheStore::Remove(std::string_view name) const noexcept
{
	unlink(GetContentPath(name).c_str());
	unlink(GetMetadataPath(name).c_str());
}
