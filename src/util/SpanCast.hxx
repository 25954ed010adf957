// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

inline std::span<const std::byte>
AsBytes(std::string_view s) noexcept
{
	return {reinterpret_cast<const std::byte *>(s.data()), s.size()};
}

inline std::string_view
ToStringView(std::span<const std::byte> s) noexcept
{
	return {reinterpret_cast<const char *>(s.data()), s.size()};
}
