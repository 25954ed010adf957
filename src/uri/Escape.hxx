// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escape and unescape in URI style ('%20').
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * Decode all percent-escaped sequences.
 *
 * @return std::nullopt on malformed escape sequences
 */
std::optional<std::string>
UriUnescape(std::string_view src, char escape_char='%');
