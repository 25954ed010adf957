// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileDescriptor.hxx"
#include "system/Error.hxx"

#include <stdexcept>

#include <sys/stat.h>

bool
FileDescriptor::Open(const char *pathname, int flags, mode_t mode) noexcept
{
	fd = ::open(pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::OpenReadOnly(const char *pathname) noexcept
{
	return Open(pathname, O_RDONLY);
}

off_t
FileDescriptor::GetSize() const noexcept
{
	struct stat st;
	return ::fstat(fd, &st) >= 0
		? (off_t)st.st_size
		: -1;
}

void
FileDescriptor::FullWrite(std::span<const std::byte> src) const
{
	while (!src.empty()) {
		ssize_t nbytes = Write(src);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;
			throw MakeErrno("Failed to write");
		}

		if (nbytes == 0)
			throw std::runtime_error{"Short write"};

		src = src.subspan(nbytes);
	}
}
