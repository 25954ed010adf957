// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>

/**
 * A "Range" request header could not be satisfied.  The message
 * describes the problem.
 */
class InvalidRangeError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * An inclusive range of bytes.
 */
struct HttpByteRange {
	uint_least64_t start, end;

	constexpr uint_least64_t GetLength() const noexcept {
		return end - start + 1;
	}
};

/**
 * Parse a single-range "Range" header ("bytes=start-end",
 * "bytes=start-" or "bytes=-suffix_length") for a resource of the
 * given size.  An end beyond the last byte is clamped.
 *
 * Throws #InvalidRangeError on error.
 *
 * @return std::nullopt if the header is empty
 */
std::optional<HttpByteRange>
ParseRangeHeader(std::string_view header, uint_least64_t size);
