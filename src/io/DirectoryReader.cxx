// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DirectoryReader.hxx"
#include "system/Error.hxx"

#include <string.h>

DirectoryReader::DirectoryReader(const char *path)
	:dirp(opendir(path))
{
	if (dirp == nullptr)
		throw FmtErrno("Failed to open directory {}", path);
}

const char *
DirectoryReader::Read() noexcept
{
	while (const auto *ent = readdir(dirp)) {
		const char *name = ent->d_name;
		if (strcmp(name, ".") != 0 && strcmp(name, "..") != 0)
			return name;
	}

	return nullptr;
}
