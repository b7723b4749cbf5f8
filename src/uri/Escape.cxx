// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Escape.hxx"

#include <algorithm>

/**
 * @see RFC 3986 2.3
 */
static constexpr bool
IsUriUnreserved(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') ||
		ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

static constexpr int
ParseHexDigit(char ch) noexcept
{
	if (ch >= '0' && ch <= '9')
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

std::size_t
UriEscape(char *dest, std::string_view src, char escape_char) noexcept
{
	static constexpr char hex_digits[] = "0123456789ABCDEF";

	std::size_t dest_length = 0;

	for (const char ch : src) {
		if (IsUriUnreserved(ch)) {
			dest[dest_length++] = ch;
		} else {
			const auto b = static_cast<unsigned char>(ch);
			dest[dest_length++] = escape_char;
			dest[dest_length++] = hex_digits[b >> 4];
			dest[dest_length++] = hex_digits[b & 0xf];
		}
	}

	return dest_length;
}

std::string
UriEscape(std::string_view src, char escape_char)
{
	std::string result;
	result.resize(src.size() * 3);
	result.resize(UriEscape(result.data(), src, escape_char));
	return result;
}

char *
UriUnescape(char *dest, std::string_view src, char escape_char) noexcept
{
	auto p = src.begin();
	const auto end = src.end();

	while (true) {
		auto q = std::find(p, end, escape_char);
		dest = std::copy(p, q, dest);

		if (q == end)
			break;

		if (end - q < 3)
			/* percent sign at the end of string */
			return nullptr;

		const int digit1 = ParseHexDigit(q[1]);
		const int digit2 = ParseHexDigit(q[2]);
		if (digit1 == -1 || digit2 == -1)
			/* invalid hex digits */
			return nullptr;

		const char ch = (char)((digit1 << 4) | digit2);
		if (ch == 0)
			/* no %00 hack allowed! */
			return nullptr;

		*dest++ = ch;
		p = q + 3;
	}

	return dest;
}

std::optional<std::string>
UriUnescape(std::string_view src, char escape_char)
{
	std::string result;
	result.resize(src.size());

	const char *end = UriUnescape(result.data(), src, escape_char);
	if (end == nullptr)
		return std::nullopt;

	result.resize(end - result.data());
	return result;
}
