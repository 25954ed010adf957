// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * Calculate the SHA256 digest of the given string and return it
 * URL-safe Base64-encoded without padding.
 */
[[gnu::pure]]
std::string
UrlSafeBase64SHA256(std::string_view src) noexcept;
