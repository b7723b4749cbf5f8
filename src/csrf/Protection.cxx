// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Protection.hxx"
#include "Config.hxx"
#include "FormField.hxx"
#include "csrf-guard/Protocol.hxx"
#include "http/CookieExtract.hxx"

#include <algorithm>
#include <cassert>

using std::string_view_literals::operator""sv;

CsrfProtection::CsrfProtection(const CsrfKey &key, const CsrfConfig &config)
	:logger("csrf"),
	 engine(key, config.timeout),
	 default_target(CompileDefaultTarget(config.default_target)),
	 default_target_method(config.default_target_method),
	 auto_insert_disable_prefixes(config.auto_insert_disable_prefixes),
	 auto_insert_max_size(config.auto_insert_max_size),
	 auto_insert(config.auto_insert)
{
	exceptions.reserve(config.exceptions.size());

	for (const auto &i : config.exceptions) {
		auto source = PathPattern::Compile(i.source);
		auto target = CompileExceptionTarget(source, i.target);
		exceptions.push_back({std::move(source), std::move(target), i.method});
	}
}

CsrfResult
CsrfProtection::CheckCredentials(const CsrfRequest &request,
				 std::chrono::system_clock::time_point now) const
{
	const auto cookie = ExtractCookieRaw(request.cookie_header,
					     CsrfGuard::COOKIE_NAME);
	if (cookie.empty())
		return CsrfResult::MALFORMED;

	const auto token = ExtractCsrfFormToken(request.content_type,
						request.body);
	if (!token)
		return CsrfResult::MALFORMED;

	return engine.CheckTokenPair(*token, cookie, now);
}

CsrfVerdict
CsrfProtection::Reroute(std::string_view uri, CsrfResult reason) const
{
	for (const auto &i : exceptions) {
		const auto captures = i.source.Match(uri);
		if (!captures)
			continue;

		auto destination = i.target.Render(*captures);
		if (!destination)
			continue;

		return {
			.reason = reason,
			.uri = std::move(*destination),
			.method = i.method,
		};
	}

	/* no exception matched: reroute to the default target;
	   Render() percent-encodes the original URI */
	PathCaptures captures;
	captures.emplace("uri"sv, uri);

	auto destination = default_target.Render(captures);

	/* CompileDefaultTarget() has verified that "uri" is the only
	   capture, therefore Render() cannot fail */
	assert(destination);

	return {
		.reason = reason,
		.uri = std::move(*destination),
		.method = default_target_method,
	};
}

CsrfVerdict
CsrfProtection::CheckRequest(const CsrfRequest &request,
			     std::chrono::system_clock::time_point now) const
{
	if (!NeedsProtection(request.method))
		return {};

	if (!HasCookies(request.cookie_header))
		/* no session, nothing to protect */
		return {};

	const auto result = CheckCredentials(request, now);
	if (result == CsrfResult::OK)
		return {};

	auto verdict = Reroute(request.uri, result);

	logger(2, "rejected ", ToString(request.method), " ",
	       request.uri, ": ", ToString(result), "; rerouting to ",
	       ToString(verdict.method), " ", verdict.uri);

	return verdict;
}

CsrfIssue
CsrfProtection::IssueToken(std::string_view cookie_header,
			   std::chrono::system_clock::time_point now) const
{
	const auto cookie_value = ExtractCookieRaw(cookie_header,
						   CsrfGuard::COOKIE_NAME);

	if (!HasCookiesExcept(cookie_header, CsrfGuard::COOKIE_NAME)) {
		/* no session */
		CsrfIssue issue;
		issue.cookie_action = cookie_value.data() != nullptr
			? CsrfIssue::CookieAction::DELETE
			: CsrfIssue::CookieAction::NONE;
		return issue;
	}

	if (const auto cookie = CsrfEngine::ParseCookie(cookie_value);
	    cookie && engine.CheckCookie(*cookie, now) == CsrfResult::OK) {
		CsrfIssue issue;
		issue.cookie_action = CsrfIssue::CookieAction::KEEP;
		issue.token = engine.MakeToken(*cookie).ToString();
		return issue;
	}

	const auto [cookie, token] = engine.GeneratePair(now);

	logger(4, "issuing new cookie");

	CsrfIssue issue;
	issue.cookie_action = CsrfIssue::CookieAction::SET;
	issue.cookie = cookie.ToString();
	issue.token = token.ToString();
	return issue;
}

bool
CsrfProtection::ShouldInject(std::string_view uri, bool is_html) const noexcept
{
	if (!auto_insert || !is_html)
		return false;

	return std::none_of(auto_insert_disable_prefixes.begin(),
			    auto_insert_disable_prefixes.end(),
			    [uri](const std::string &prefix){
				    return uri.starts_with(prefix);
			    });
}
