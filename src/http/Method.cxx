// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Method.hxx"

using std::string_view_literals::operator""sv;

static constexpr struct {
	HttpMethod method;
	std::string_view name;
} http_method_names[] = {
	{HttpMethod::HEAD, "HEAD"sv},
	{HttpMethod::GET, "GET"sv},
	{HttpMethod::POST, "POST"sv},
	{HttpMethod::PUT, "PUT"sv},
	{HttpMethod::DELETE, "DELETE"sv},
	{HttpMethod::OPTIONS, "OPTIONS"sv},
	{HttpMethod::TRACE, "TRACE"sv},
	{HttpMethod::CONNECT, "CONNECT"sv},
	{HttpMethod::PATCH, "PATCH"sv},
};

HttpMethod
ParseHttpMethod(std::string_view s) noexcept
{
	for (const auto &i : http_method_names)
		if (i.name == s)
			return i.method;

	return HttpMethod::INVALID;
}

std::string_view
ToString(HttpMethod method) noexcept
{
	for (const auto &i : http_method_names)
		if (i.method == method)
			return i.name;

	return {};
}
