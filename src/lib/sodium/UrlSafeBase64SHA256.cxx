// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UrlSafeBase64SHA256.hxx"
#include "SHA256.hxx"
#include "util/SpanCast.hxx"

#include <sodium/utils.h>

std::string
UrlSafeBase64SHA256(std::string_view src) noexcept
{
	const auto hash = SHA256(AsBytes(src));

	constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
	char buffer[sodium_base64_ENCODED_LEN(crypto_hash_sha256_BYTES,
					      variant)];
	sodium_bin2base64(buffer, sizeof(buffer),
			  reinterpret_cast<const unsigned char *>(hash.data()),
			  hash.size(), variant);
	return buffer;
}
