// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Engine.hxx"
#include "PathPattern.hxx"
#include "Error.hxx"
#include "http/Method.hxx"
#include "Logger.hxx"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct CsrfConfig;
class CsrfKey;

/**
 * The parts of an incoming request which are relevant for CSRF
 * protection.  All strings are owned by the caller.
 */
struct CsrfRequest {
	HttpMethod method;

	/**
	 * The request URI (path and query string).
	 */
	std::string_view uri;

	/**
	 * The "Cookie" request header (empty if there is none).
	 */
	std::string_view cookie_header;

	/**
	 * The "Content-Type" request header (empty if there is
	 * none).
	 */
	std::string_view content_type;

	/**
	 * The request body (or a prefix of it which is large enough
	 * to contain the token).
	 */
	std::string_view body;
};

/**
 * What the host shall do with a request.
 */
struct CsrfVerdict {
	/**
	 * Why the request was rejected; CsrfResult::OK if it was
	 * accepted.
	 */
	CsrfResult reason = CsrfResult::OK;

	/**
	 * If the request was rejected: the URI and the method it
	 * shall be rerouted to.
	 */
	std::string uri;
	HttpMethod method = HttpMethod::INVALID;

	bool IsAccepted() const noexcept {
		return reason == CsrfResult::OK;
	}
};

/**
 * The token which shall be embedded in a response, and what to do
 * with the client's cookie.
 */
struct CsrfIssue {
	enum class CookieAction : uint_least8_t {
		/**
		 * The client's cookie is valid; nothing needs to be
		 * sent.
		 */
		KEEP,

		/**
		 * Send #cookie to the client.
		 */
		SET,

		/**
		 * The client has no session, but a stale cookie;
		 * delete it.
		 */
		DELETE,

		/**
		 * The client has no session and no cookie.
		 */
		NONE,
	};

	CookieAction cookie_action;

	/**
	 * The base64url cookie value (only with
	 * CookieAction::SET).
	 */
	std::string cookie;

	/**
	 * The base64url token which belongs to the client's cookie;
	 * empty if the client has no session.
	 */
	std::string token;

	bool HasToken() const noexcept {
		return !token.empty();
	}
};

enum class CsrfInjectMode : uint_least8_t {
	/**
	 * The body is small enough to be transformed in memory; see
	 * CsrfInjectBuffer().
	 */
	BUFFER,

	/**
	 * The body must be streamed; see NewCsrfInjectIstream().
	 */
	STREAM,
};

/**
 * The policy layer: decides which requests are accepted, where
 * violating requests go and which responses get the token.  The
 * host calls these methods from its request/response handlers.
 *
 * This object is immutable after construction and may be shared by
 * all threads.
 */
class CsrfProtection {
	struct Exception {
		PathPattern source, target;
		HttpMethod method;
	};

	const Logger logger;

	const CsrfEngine engine;

	const PathPattern default_target;
	const HttpMethod default_target_method;

	/**
	 * Checked in this order; the first match wins.
	 */
	std::vector<Exception> exceptions;

	std::vector<std::string> auto_insert_disable_prefixes;

	const uint64_t auto_insert_max_size;

	const bool auto_insert;

public:
	/**
	 * Throws #CsrfConfigError if a path template is invalid.
	 *
	 * @param key the secret key; it must remain valid as long as
	 * this object exists
	 */
	CsrfProtection(const CsrfKey &key, const CsrfConfig &config);

	CsrfProtection(const CsrfProtection &) = delete;
	CsrfProtection &operator=(const CsrfProtection &) = delete;

	const CsrfEngine &GetEngine() const noexcept {
		return engine;
	}

	static constexpr bool NeedsProtection(HttpMethod method) noexcept {
		return MethodNeedsCsrfProtection(method);
	}

	/**
	 * Verify an incoming request.  Requests with safe methods and
	 * requests without any cookie (i.e. without a session) are
	 * accepted.  A violation is logged, and the verdict contains
	 * the URI and the method the request shall be rerouted to.
	 */
	CsrfVerdict CheckRequest(const CsrfRequest &request,
				 std::chrono::system_clock::time_point now) const;

	/**
	 * Determine the token for a response.  A still valid cookie is
	 * reused; else a new pair is generated.  Without a session
	 * (no cookie besides ours), no token is issued.
	 */
	CsrfIssue IssueToken(std::string_view cookie_header,
			     std::chrono::system_clock::time_point now) const;

	/**
	 * Shall the token be inserted into this response?
	 *
	 * @param uri the request URI
	 * @param is_html does the response have a HTML body?
	 */
	[[gnu::pure]]
	bool ShouldInject(std::string_view uri, bool is_html) const noexcept;

	/**
	 * @param length the length of the response body if known
	 */
	[[gnu::pure]]
	CsrfInjectMode ChooseInjectMode(std::optional<uint64_t> length) const noexcept {
		return length && *length <= auto_insert_max_size
			? CsrfInjectMode::BUFFER
			: CsrfInjectMode::STREAM;
	}

private:
	/**
	 * Check the cookie/token pair presented by the request.
	 */
	CsrfResult CheckCredentials(const CsrfRequest &request,
				    std::chrono::system_clock::time_point now) const;

	CsrfVerdict Reroute(std::string_view uri, CsrfResult reason) const;
};
