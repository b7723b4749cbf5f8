// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FormField.hxx"
#include "csrf-guard/Protocol.hxx"
#include "uri/Escape.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

static constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? ch + ('a' - 'A')
		: ch;
}

[[gnu::pure]]
static bool
EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(), [](char x, char y){
			return ToLowerASCII(x) == ToLowerASCII(y);
		});
}

[[gnu::pure]]
static bool
StartsWithIgnoreCase(std::string_view s, std::string_view prefix) noexcept
{
	return s.size() >= prefix.size() &&
		EqualsIgnoreCase(s.substr(0, prefix.size()), prefix);
}

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t';
}

[[gnu::pure]]
static std::string_view
Strip(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespace(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && IsWhitespace(s.back()))
		s.remove_suffix(1);
	return s;
}

/**
 * Split the string at the first occurrence of the separator.  If the
 * separator is not found, the whole string is returned as the first
 * element and the second one is a "null" string_view.
 */
static constexpr std::pair<std::string_view, std::string_view>
Split(std::string_view s, char separator) noexcept
{
	const auto i = s.find(separator);
	if (i == s.npos)
		return {s, {}};

	return {s.substr(0, i), s.substr(i + 1)};
}

bool
IsMultipartFormData(std::string_view content_type) noexcept
{
	const auto media_type = Strip(Split(content_type, ';').first);
	return EqualsIgnoreCase(media_type, "multipart/form-data"sv);
}

std::optional<std::string>
ExtractUrlEncodedField(std::string_view body, std::string_view name)
{
	while (!body.empty()) {
		const auto [item, rest] = Split(body, '&');
		body = rest;

		const auto [key, escaped_value] = Split(item, '=');
		if (key != name || escaped_value.data() == nullptr)
			continue;

		std::string value{escaped_value};
		std::replace(value.begin(), value.end(), '+', ' ');
		return UriUnescape(value);
	}

	return std::nullopt;
}

/**
 * Remove the first line from the string and return it (without the
 * line terminator).  Lines end with LF or CR LF; a single CR is
 * accepted, too.
 */
static std::string_view
NextLine(std::string_view &rest) noexcept
{
	const auto eol = rest.find_first_of("\r\n"sv);
	if (eol == rest.npos) {
		const auto line = rest;
		rest = {};
		return line;
	}

	const auto line = rest.substr(0, eol);
	if (rest[eol] == '\r' && eol + 1 < rest.size() && rest[eol + 1] == '\n')
		rest.remove_prefix(eol + 2);
	else
		rest.remove_prefix(eol + 1);
	return line;
}

/**
 * Is this a "Content-Disposition: form-data" header announcing a
 * field with the given name?
 */
[[gnu::pure]]
static bool
IsDispositionFor(std::string_view line, std::string_view name) noexcept
{
	static constexpr auto header = "content-disposition:"sv;
	if (!StartsWithIgnoreCase(line, header))
		return false;

	auto [type, params] = Split(line.substr(header.size()), ';');
	if (!EqualsIgnoreCase(Strip(type), "form-data"sv))
		return false;

	while (params.data() != nullptr) {
		const auto [param, rest] = Split(params, ';');
		params = rest;

		const auto [key, value] = Split(Strip(param), '=');
		if (!EqualsIgnoreCase(Strip(key), "name"sv) ||
		    value.data() == nullptr)
			continue;

		auto v = Strip(value);
		if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
			v = v.substr(1, v.size() - 2);

		return v == name;
	}

	return false;
}

std::optional<std::string_view>
ExtractMultipartField(std::string_view body, std::string_view name) noexcept
{
	while (!body.empty()) {
		if (!IsDispositionFor(NextLine(body), name))
			continue;

		/* skip the remaining part headers */
		while (!body.empty())
			if (NextLine(body).empty())
				return NextLine(body);

		break;
	}

	return std::nullopt;
}

std::optional<std::string>
ExtractCsrfFormToken(std::string_view content_type, std::string_view body)
{
	if (IsMultipartFormData(content_type)) {
		const auto value = ExtractMultipartField(body, CsrfGuard::FORM_FIELD);
		if (!value)
			return std::nullopt;

		return std::string{*value};
	} else
		return ExtractUrlEncodedField(body, CsrfGuard::FORM_FIELD);
}
