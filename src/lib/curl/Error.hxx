// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <curl/curl.h>

#include <stdexcept>

namespace Curl {

/**
 * An error reported by libCURL.  It carries the #CURLcode.
 */
class Error : public std::runtime_error {
	CURLcode code;

public:
	Error(CURLcode _code, const std::string &msg) noexcept
		:std::runtime_error(msg), code(_code) {}

	CURLcode GetCode() const noexcept {
		return code;
	}
};

/**
 * Construct an #Error from a #CURLcode, appending libCURL's
 * description to the given prefix.
 */
Error
MakeError(CURLcode code, const char *prefix) noexcept;

} // namespace Curl
