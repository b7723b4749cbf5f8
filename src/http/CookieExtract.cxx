// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CookieExtract.hxx"

#include <algorithm>
#include <string_view>

/**
 * RFC 2616 2.2: any CHAR except CTLs or separators.
 */
static constexpr bool
IsHttpTokenChar(char ch) noexcept
{
	const auto u = static_cast<unsigned char>(ch);
	if (u <= 0x20 || u >= 0x7f)
		return false;

	constexpr std::string_view separators = "()<>@,;:\\\"/[]?={}";
	return separators.find(ch) == separators.npos;
}

static constexpr bool
IsHttpWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

[[gnu::always_inline]]
static constexpr bool
char_is_cookie_octet(char ch) noexcept
{
	return ch == 0x21 || (ch >= 0x23 && ch <= 0x2b) ||
		(ch >= 0x2d && ch <= 0x3a) ||
		(ch >= 0x3c && ch <= 0x5b) ||
		(ch >= 0x5d && ch <= 0x7e);
}

[[gnu::always_inline]]
static constexpr bool
char_is_rfc_ignorant_cookie_octet(char ch) noexcept
{
	return char_is_cookie_octet(ch) ||
		ch == ' ' || ch == ',';
}

template<typename P>
static std::string_view
NextWhile(std::string_view &input, P &&p) noexcept
{
	const auto i = std::find_if_not(input.begin(), input.end(), p);
	const std::size_t n = std::distance(input.begin(), i);
	const auto result = input.substr(0, n);
	input.remove_prefix(n);
	return result;
}

static std::string_view
StripLeft(std::string_view s) noexcept
{
	NextWhile(s, IsHttpWhitespace);
	return s;
}

static std::string_view
http_next_token(std::string_view &input) noexcept
{
	return NextWhile(input, IsHttpTokenChar);
}

static std::string_view
http_next_quoted_string_raw(std::string_view &input) noexcept
{
	input.remove_prefix(1);

	const auto end = input.find('"');
	/* if there is no closing quote, we ignore it and make the
	   best of it */
	const auto value = input.substr(0, end);
	input = end == input.npos
		? std::string_view{}
		: input.substr(end + 1);
	return value;
}

static std::string_view
cookie_next_rfc_ignorant_value(std::string_view &input) noexcept
{
	if (!input.empty() && input.front() == '"')
		return http_next_quoted_string_raw(input);
	else
		return NextWhile(input, char_is_rfc_ignorant_cookie_octet);
}

/**
 * Call the given function for each segment of the "Cookie" header,
 * with leading whitespace stripped.  Stops when the function returns
 * true.
 */
template<typename F>
static bool
ForEachCookie(std::string_view cookie_header, F &&f) noexcept
{
	while (true) {
		const auto semicolon = cookie_header.find(';');
		if (f(StripLeft(cookie_header.substr(0, semicolon))))
			return true;

		if (semicolon == cookie_header.npos)
			return false;

		cookie_header.remove_prefix(semicolon + 1);
	}
}

std::string_view
ExtractCookieRaw(std::string_view cookie_header, std::string_view name) noexcept
{
	std::string_view result{};

	ForEachCookie(cookie_header, [name, &result](std::string_view i){
		const auto current_name = http_next_token(i);
		if (current_name != name)
			return false;

		if (i.empty())
			result = i;
		else if (i.front() == '=') {
			i.remove_prefix(1);
			result = cookie_next_rfc_ignorant_value(i);
		}

		return true;
	});

	return result;
}

bool
HasCookies(std::string_view cookie_header) noexcept
{
	return ForEachCookie(cookie_header, [](std::string_view i){
		return !http_next_token(i).empty();
	});
}

bool
HasCookiesExcept(std::string_view cookie_header, std::string_view name) noexcept
{
	return ForEachCookie(cookie_header, [name](std::string_view i){
		const auto current_name = http_next_token(i);
		return !current_name.empty() && current_name != name;
	});
}
