// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

enum class HttpMethod : uint_least8_t {
	/**
	 * Not a known HTTP method; used as an error indicator by
	 * ParseHttpMethod().
	 */
	INVALID,

	HEAD,
	GET,
	POST,
	PUT,
	DELETE,
	OPTIONS,
	TRACE,
	CONNECT,
	PATCH,
};

/**
 * Parse an (upper case) HTTP method name.
 *
 * @return the method or HttpMethod::INVALID
 */
[[gnu::pure]]
HttpMethod
ParseHttpMethod(std::string_view s) noexcept;

[[gnu::const]]
std::string_view
ToString(HttpMethod method) noexcept;

/**
 * Can a request with this method change server state, i.e. must it
 * present a valid cookie/token pair?  "Safe" methods (RFC 7231 4.2.1)
 * and CONNECT are exempt.
 */
constexpr bool
MethodNeedsCsrfProtection(HttpMethod method) noexcept
{
	switch (method) {
	case HttpMethod::GET:
	case HttpMethod::HEAD:
	case HttpMethod::CONNECT:
	case HttpMethod::OPTIONS:
		return false;

	default:
		return true;
	}
}
