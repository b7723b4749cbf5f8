// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PathPattern.hxx"
#include "Error.hxx"
#include "uri/Escape.hxx"

#include <algorithm>
#include <set>

using std::string_view_literals::operator""sv;

static constexpr bool
IsCaptureNameChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') || ch == '_' || ch == '-';
}

/**
 * Split the string at the first occurrence of the given character.
 * If the character is not found, the second part is empty (with a
 * nullptr data pointer).
 */
static std::pair<std::string_view, std::string_view>
Split(std::string_view s, char ch) noexcept
{
	const auto i = s.find(ch);
	if (i == s.npos)
		return {s, {}};

	return {s.substr(0, i), s.substr(i + 1)};
}

template<typename F>
static void
ForEachSplit(std::string_view s, char separator, F &&f)
{
	while (true) {
		const auto [head, tail] = Split(s, separator);
		f(head);

		if (tail.data() == nullptr)
			break;

		s = tail;
	}
}

static std::string
UnescapeLiteral(std::string_view s)
{
	auto value = UriUnescape(s);
	if (!value)
		throw CsrfConfigError("Malformed percent-encoding in path pattern: " +
				      std::string{s});

	return std::move(*value);
}

PathPattern
PathPattern::Compile(std::string_view pattern)
{
	if (!pattern.starts_with('/'))
		throw CsrfConfigError("Path pattern must begin with a slash: " +
				      std::string{pattern});

	PathPattern result;
	std::set<std::string, std::less<>> names;

	auto compile_part = [&names, pattern](std::string_view s) -> Part {
		const bool open = s.starts_with('<'), close = s.ends_with('>');
		if (open && close && s.size() >= 2) {
			const auto name = s.substr(1, s.size() - 2);
			if (name.empty() ||
			    !std::all_of(name.begin(), name.end(), IsCaptureNameChar))
				throw CsrfConfigError("Malformed capture name in path pattern: " +
						      std::string{pattern});

			if (!names.emplace(name).second)
				throw CsrfConfigError("Duplicate capture name in path pattern: " +
						      std::string{pattern});

			return {std::string{name}, {}, true};
		}

		if (s.find_first_of("<>"sv) != s.npos)
			throw CsrfConfigError("Malformed capture in path pattern: " +
					      std::string{pattern});

		return {UnescapeLiteral(s), std::string{s}, false};
	};

	const auto [path, query_string] = Split(pattern.substr(1), '?');

	ForEachSplit(path, '/', [&](std::string_view segment){
		result.segments.emplace_back(compile_part(segment));
	});

	if (query_string.data() != nullptr) {
		ForEachSplit(query_string, '&', [&](std::string_view parameter){
			const auto [name, value] = Split(parameter, '=');
			if (name.empty() || value.data() == nullptr)
				throw CsrfConfigError("Malformed query parameter in path pattern: " +
						      std::string{pattern});

			if (name.find_first_of("<>"sv) != name.npos)
				throw CsrfConfigError("Captures are not allowed in query parameter names: " +
						      std::string{pattern});

			auto decoded_name = UnescapeLiteral(name);
			for (const auto &i : result.query)
				if (i.name == decoded_name)
					throw CsrfConfigError("Duplicate query parameter in path pattern: " +
							      std::string{pattern});

			result.query.push_back({
				std::move(decoded_name),
				std::string{name},
				compile_part(value),
			});
		});
	}

	return result;
}

/**
 * Bind or compare one decoded value.
 *
 * @return false on mismatch
 */
static bool
MatchPart(const auto &part, std::string &&value, PathCaptures &captures)
{
	if (part.capture) {
		captures.emplace(part.value, std::move(value));
		return true;
	} else
		return part.value == value;
}

std::optional<PathCaptures>
PathPattern::Match(std::string_view uri) const
{
	if (!uri.starts_with('/'))
		return std::nullopt;

	const auto [path, query_string] = Split(uri.substr(1), '?');

	std::vector<std::string_view> concrete;
	ForEachSplit(path, '/', [&concrete](std::string_view segment){
		concrete.push_back(segment);
	});

	if (concrete.size() != segments.size())
		return std::nullopt;

	PathCaptures captures;

	for (std::size_t i = 0; i < segments.size(); ++i) {
		auto value = UriUnescape(concrete[i]);
		if (!value || !MatchPart(segments[i], std::move(*value), captures))
			return std::nullopt;
	}

	if (query.empty())
		return captures;

	/* decode all parameters of the concrete query string; the
	   first occurrence of a name wins */
	std::map<std::string, std::string, std::less<>> parameters;
	if (query_string.data() != nullptr) {
		bool valid = true;
		ForEachSplit(query_string, '&', [&](std::string_view parameter){
			if (parameter.empty())
				return;

			const auto [name, value] = Split(parameter, '=');
			auto n = UriUnescape(name), v = UriUnescape(value);
			if (!n || !v) {
				valid = false;
				return;
			}

			parameters.emplace(std::move(*n), std::move(*v));
		});

		if (!valid)
			return std::nullopt;
	}

	for (const auto &i : query) {
		auto p = parameters.find(i.name);
		if (p == parameters.end() ||
		    !MatchPart(i.value, std::string{p->second}, captures))
			return std::nullopt;
	}

	return captures;
}

static bool
RenderPart(std::string &dest, const auto &part, const PathCaptures &captures)
{
	if (!part.capture) {
		dest += part.raw;
		return true;
	}

	const auto i = captures.find(part.value);
	if (i == captures.end())
		return false;

	dest += UriEscape(i->second);
	return true;
}

std::optional<std::string>
PathPattern::Render(const PathCaptures &captures) const
{
	std::string result;

	for (const auto &i : segments) {
		result.push_back('/');
		if (!RenderPart(result, i, captures))
			return std::nullopt;
	}

	char separator = '?';
	for (const auto &i : query) {
		result.push_back(separator);
		separator = '&';

		result += i.raw_name;
		result.push_back('=');
		if (!RenderPart(result, i.value, captures))
			return std::nullopt;
	}

	return result;
}

bool
PathPattern::HasCapture(std::string_view name) const noexcept
{
	bool found = false;
	ForEachCapture([name, &found](const std::string &i){
		if (i == name)
			found = true;
	});
	return found;
}

std::vector<std::string_view>
PathPattern::GetCaptureNames() const
{
	std::vector<std::string_view> result;
	ForEachCapture([&result](const std::string &i){
		result.push_back(i);
	});
	return result;
}

PathPattern
CompileDefaultTarget(std::string_view pattern)
{
	auto result = PathPattern::Compile(pattern);

	for (const auto name : result.GetCaptureNames())
		if (name != "uri"sv)
			throw CsrfConfigError("Default target may only use the capture <uri>, not <" +
					      std::string{name} + ">");

	return result;
}

PathPattern
CompileExceptionTarget(const PathPattern &source, std::string_view pattern)
{
	auto result = PathPattern::Compile(pattern);

	for (const auto name : result.GetCaptureNames())
		if (!source.HasCapture(name))
			throw CsrfConfigError("Capture <" + std::string{name} +
					      "> is not defined by the exception source");

	return result;
}
