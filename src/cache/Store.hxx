// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Metadata.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

class CacheStore;

/**
 * An open cache entry.
 */
struct CacheEntry {
	CacheMetadata metadata;

	UniqueFileDescriptor content;
};

/**
 * Writes a new cache entry: first the content (streamed with
 * Append()), then the metadata (Commit()).  If the object is
 * destroyed without Commit(), both files are removed.
 *
 * The content is written to an unnamed O_TMPFILE which gets its
 * name only in Commit(), after the metadata file, so a directory
 * scan never sees a content file being written.
 */
class CacheEntryWriter {
	const CacheStore &store;

	const std::string name;

	UniqueFileDescriptor fd;

	uint_least64_t size = 0;

	/**
	 * Does #fd refer to an unnamed file which needs to be linked
	 * in Commit()?  False if the filesystem does not support
	 * O_TMPFILE; then the content is written to its final name.
	 */
	bool anonymous;

	bool committed = false;

public:
	/**
	 * Throws on error.
	 */
	CacheEntryWriter(const CacheStore &_store, std::string_view _name);

	~CacheEntryWriter() noexcept;

	CacheEntryWriter(const CacheEntryWriter &) = delete;
	CacheEntryWriter &operator=(const CacheEntryWriter &) = delete;

	/**
	 * The number of content bytes written so far.
	 */
	uint_least64_t GetSize() const noexcept {
		return size;
	}

	bool IsAnonymous() const noexcept {
		return anonymous;
	}

	void Append(std::span<const std::byte> src);

	/**
	 * Finish the content file and write the metadata file.
	 */
	void Commit(const CacheMetadata &metadata);
};

/**
 * The cache directory.  Each entry consists of a content file and a
 * "<name>.meta" file containing #CacheMetadata as JSON.  An entry
 * exists only if both files exist.
 *
 * The caller is responsible for serializing access to one entry
 * (see #KeyLockRegistry).
 */
class CacheStore {
	const std::string directory;

public:
	explicit CacheStore(std::string_view _directory) noexcept
		:directory(_directory) {}

	const std::string &GetDirectory() const noexcept {
		return directory;
	}

	/**
	 * Create the cache directory (and its parents) if it does
	 * not exist.  Throws on error.
	 */
	void CreateDirectory() const;

	std::string GetContentPath(std::string_view name) const noexcept;
	std::string GetMetadataPath(std::string_view name) const noexcept;

	/**
	 * Do both files of the entry exist?
	 */
	bool Exists(std::string_view name) const noexcept;

	/**
	 * Has the entry been retrieved longer than #max_age ago?  A
	 * zero #max_age disables expiry.  Unreadable or malformed
	 * metadata counts as stale.
	 */
	bool IsStale(std::string_view name,
		     std::chrono::system_clock::duration max_age) const noexcept;

	/**
	 * Throws on error.
	 */
	CacheMetadata ReadMetadata(std::string_view name) const;

	/**
	 * Open an entry for reading.  Throws on error (e.g.
	 * std::system_error with ENOENT if it does not exist).
	 */
	CacheEntry Open(std::string_view name) const;

	CacheEntryWriter BeginWrite(std::string_view name) const {
		return CacheEntryWriter{*this, name};
	}

	/**
	 * Write a complete entry.  On error, both files are removed
	 * and the exception is rethrown.
	 */
	void Write(std::string_view name, const CacheMetadata &metadata,
		   std::span<const std::byte> content) const;

	/**
	 * Mark the entry as used now by updating the modification
	 * time of its metadata file.  Throws on error.
	 */
	void Touch(std::string_view name) const;

	/**
	 * Delete both files of the entry; missing files are ignored.
	 */
	void Remove(std::string_view name) const noexcept;
};
