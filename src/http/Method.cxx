// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Method.hxx"

using std::string_view_literals::operator""sv;

HttpMethod
http_method_parse(std::string_view s) noexcept
{
	if (s == "GET"sv)
		return HttpMethod::GET;
	else if (s == "HEAD"sv)
		return HttpMethod::HEAD;
	else if (s == "POST"sv)
		return HttpMethod::POST;
	else if (s == "PUT"sv)
		return HttpMethod::PUT;
	else if (s == "DELETE"sv)
		return HttpMethod::DELETE;
	else if (s == "OPTIONS"sv)
		return HttpMethod::OPTIONS;
	else if (s == "PATCH"sv)
		return HttpMethod::PATCH;
	else
		return HttpMethod::UNDEFINED;
}
