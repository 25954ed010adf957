// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FileDescriptor.hxx"

#include <dirent.h>

/**
 * Reader for directory entries.
 */
class DirectoryReader {
	DIR *const dirp;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit DirectoryReader(const char *path);

	~DirectoryReader() noexcept {
		closedir(dirp);
	}

	DirectoryReader(const DirectoryReader &) = delete;
	DirectoryReader &operator=(const DirectoryReader &) = delete;

	FileDescriptor GetFileDescriptor() const noexcept {
		return FileDescriptor{dirfd(dirp)};
	}

	/**
	 * Read the next entry, skipping "." and "..".
	 *
	 * @return the entry name or nullptr at the end
	 */
	const char *Read() noexcept;
};
