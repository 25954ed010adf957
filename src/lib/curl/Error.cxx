// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <fmt/core.h>

namespace Curl {

Error
MakeError(CURLcode code, const char *prefix) noexcept
{
	return Error{code, fmt::format("{}: {}", prefix,
				       curl_easy_strerror(code))};
}

} // namespace Curl
