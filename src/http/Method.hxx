// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

enum class HttpMethod : uint_least8_t {
	UNDEFINED,
	HEAD,
	GET,
	POST,
	PUT,
	DELETE,
	OPTIONS,
	PATCH,
};

[[gnu::pure]]
HttpMethod
http_method_parse(std::string_view s) noexcept;
