// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Token.hxx"
#include "Error.hxx"

#include <chrono>
#include <optional>
#include <string_view>
#include <utility>

class CsrfKey;

/**
 * Generates and verifies cookie/token pairs.  Both halves carry the
 * same nonce and issue time; their MACs are keyed BLAKE2b digests
 * over a role byte, the nonce and the issue time, so neither half
 * can be forged or substituted for the other without the key.
 *
 * This object has no mutable state and may be shared by all
 * threads.
 */
class CsrfEngine {
	const CsrfKey &key;

	const std::chrono::seconds duration;

public:
	/**
	 * Throws if libsodium cannot be initialized.
	 *
	 * @param _key the secret key; it must remain valid as long as
	 * this object exists
	 * @param _duration how long a pair remains valid after it was
	 * issued
	 */
	CsrfEngine(const CsrfKey &_key, std::chrono::seconds _duration);

	CsrfEngine(const CsrfEngine &) = delete;
	CsrfEngine &operator=(const CsrfEngine &) = delete;

	std::chrono::seconds GetDuration() const noexcept {
		return duration;
	}

	/**
	 * Generate a new pair with a fresh random nonce.
	 */
	std::pair<CsrfCookie, CsrfToken> GeneratePair(std::chrono::system_clock::time_point now) const noexcept;

	/**
	 * Derive the token which belongs to the given cookie.  The
	 * cookie should have been verified with CheckCookie().
	 */
	CsrfToken MakeToken(const CsrfCookie &cookie) const noexcept;

	/**
	 * Decode a base64url cookie string.  This does not verify the
	 * MAC.
	 */
	static std::optional<CsrfCookie> ParseCookie(std::string_view s) noexcept;

	/**
	 * Decode a base64url token string.  This does not verify the
	 * MAC.
	 */
	static std::optional<CsrfToken> ParseToken(std::string_view s) noexcept;

	/**
	 * Verify a cookie on its own: its MAC and its age.
	 */
	[[gnu::pure]]
	CsrfResult CheckCookie(const CsrfCookie &cookie,
			       std::chrono::system_clock::time_point now) const noexcept;

	/**
	 * Verify a pair: both MACs, the binding between token and
	 * cookie and the age.
	 */
	[[gnu::pure]]
	CsrfResult CheckTokenPair(const CsrfToken &token,
				  const CsrfCookie &cookie,
				  std::chrono::system_clock::time_point now) const noexcept;

	[[gnu::pure]]
	bool VerifyTokenPair(const CsrfToken &token, const CsrfCookie &cookie,
			     std::chrono::system_clock::time_point now) const noexcept {
		return CheckTokenPair(token, cookie, now) == CsrfResult::OK;
	}

	/**
	 * Like CheckTokenPair(), but decode both strings first.
	 */
	[[gnu::pure]]
	CsrfResult CheckTokenPair(std::string_view token,
				  std::string_view cookie,
				  std::chrono::system_clock::time_point now) const noexcept;

private:
	[[gnu::pure]]
	CsrfValue::Mac ComputeMac(CsrfGuard::Role role,
				  const CsrfValue::Nonce &nonce,
				  std::chrono::system_clock::time_point issued_at) const noexcept;

	[[gnu::pure]]
	bool CheckMac(CsrfGuard::Role role, const CsrfValue &value) const noexcept;

	[[gnu::pure]]
	bool IsFresh(std::chrono::system_clock::time_point issued_at,
		     std::chrono::system_clock::time_point now) const noexcept;
};
