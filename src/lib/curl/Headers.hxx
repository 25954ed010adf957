// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <map>
#include <string>

namespace Curl {

/**
 * Response headers received from libCURL.  The names are lower case.
 */
using Headers = std::multimap<std::string, std::string, std::less<>>;

} // namespace Curl
