// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Method.hxx"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

class CsrfKey;

/**
 * Configuration of #CsrfProtection.  Path templates are kept as
 * strings here; #CsrfProtection compiles them.
 */
struct CsrfConfig {
	/**
	 * How long a cookie/token pair remains valid.
	 */
	std::chrono::seconds timeout = std::chrono::hours(12);

	/**
	 * Where violating requests are rerouted to (unless an
	 * exception matches).  It may contain the capture "<uri>",
	 * which is replaced with the original request URI.
	 */
	std::string default_target = "/";
	HttpMethod default_target_method = HttpMethod::GET;

	struct Exception {
		/**
		 * Violating requests whose URI matches this template
		 * are rerouted to #target instead of the default
		 * target.
		 */
		std::string source;

		/**
		 * May only use captures defined by #source.
		 */
		std::string target;

		HttpMethod method = HttpMethod::GET;
	};

	/**
	 * Checked in this order; the first match wins.
	 */
	std::vector<Exception> exceptions;

	/**
	 * The secret key (standard base64 of 32 bytes).  If empty, see
	 * LoadCsrfKey().
	 */
	std::string secret;

	/**
	 * Insert the token into all HTML forms?
	 */
	bool auto_insert = true;

	/**
	 * Request URIs starting with one of these prefixes are
	 * excluded from #auto_insert.
	 */
	std::vector<std::string> auto_insert_disable_prefixes;

	/**
	 * Bodies up to this size are transformed in memory; larger ones
	 * (and those with unknown length) are streamed.
	 */
	uint64_t auto_insert_max_size = 16 * 1024;
};

/**
 * The name of the environment variable which provides the secret key
 * if the configuration does not.
 */
constexpr const char *CSRF_GUARD_SECRET_KEY_ENV = "CSRF_GUARD_SECRET_KEY";

/**
 * Determine the secret key: #CsrfConfig::secret if set, else the
 * environment variable #CSRF_GUARD_SECRET_KEY_ENV, else a random key
 * (which means tokens will not survive a restart; a warning is
 * logged).
 *
 * Throws #CsrfConfigError if the configured secret is malformed.
 */
CsrfKey
LoadCsrfKey(const CsrfConfig &config);
