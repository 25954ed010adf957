// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sodium/crypto_hash_sha256.h>

#include <array>
#include <cstddef>
#include <span>

using SHA256DigestBuffer = std::array<std::byte, crypto_hash_sha256_BYTES>;

inline void
SHA256(std::byte *out, std::span<const std::byte> src) noexcept
{
	crypto_hash_sha256(reinterpret_cast<unsigned char *>(out),
			   reinterpret_cast<const unsigned char *>(src.data()),
			   src.size());
}

[[gnu::pure]]
inline SHA256DigestBuffer
SHA256(std::span<const std::byte> src) noexcept
{
	SHA256DigestBuffer out;
	SHA256(out.data(), src);
	return out;
}
