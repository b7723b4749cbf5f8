// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * Extract a cookie with a specific name from the "Cookie" request
 * header value.
 *
 * @param cookie_header the "Cookie" request header
 * @param name the cookie name to look for
 *
 * @return the raw (i.e. still quoted) cookie value or a
 * default-initialized std::string_view if no such cookie was found
 */
[[gnu::pure]]
std::string_view
ExtractCookieRaw(std::string_view cookie_header, std::string_view name) noexcept;

/**
 * Does the "Cookie" request header contain at least one cookie?
 */
[[gnu::pure]]
bool
HasCookies(std::string_view cookie_header) noexcept;

/**
 * Does the "Cookie" request header contain a cookie with a name
 * other than the given one?
 */
[[gnu::pure]]
bool
HasCookiesExcept(std::string_view cookie_header, std::string_view name) noexcept;
