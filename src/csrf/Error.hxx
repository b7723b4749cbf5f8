// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string_view>

/**
 * The outcome of verifying a cookie/token pair.  Callers must treat
 * every value other than #OK as a violation.
 */
enum class CsrfResult : uint_least8_t {
	OK,

	/**
	 * The cookie or the token could not be decoded (wrong length,
	 * not base64url, timestamp out of range).
	 */
	MALFORMED,

	/**
	 * A MAC does not match the secret key.
	 */
	INVALID_MAC,

	/**
	 * The pair was issued longer ago than the configured duration
	 * (or claims to be issued in the future).
	 */
	EXPIRED,

	/**
	 * Cookie and token are both authentic, but they do not
	 * belong to each other.
	 */
	MISMATCH,
};

[[gnu::const]]
std::string_view
ToString(CsrfResult result) noexcept;

/**
 * A configuration error, detected while building the policy before
 * traffic is served.
 */
class CsrfConfigError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};
