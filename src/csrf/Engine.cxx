// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Engine.hxx"
#include "Key.hxx"
#include "crypto/GenericHash.hxx"
#include "crypto/Init.hxx"

#include <sodium/randombytes.h>
#include <sodium/utils.h>

CsrfEngine::CsrfEngine(const CsrfKey &_key, std::chrono::seconds _duration)
	:key(_key), duration(_duration)
{
	SodiumInit();
}

CsrfValue::Mac
CsrfEngine::ComputeMac(CsrfGuard::Role role, const CsrfValue::Nonce &nonce,
		       std::chrono::system_clock::time_point issued_at) const noexcept
{
	const uint64_t t = CsrfValue::ImportTime(issued_at);

	std::array<std::byte, 8> t_be;
	for (unsigned i = 0; i < t_be.size(); ++i)
		t_be[i] = static_cast<std::byte>(t >> (56 - 8 * i));

	GenericHashState state(CsrfGuard::MAC_SIZE, key.GetSpan());
	state.UpdateT(role);
	state.Update(nonce);
	state.Update(t_be);
	return state.GetFinalT<CsrfGuard::MAC_SIZE>();
}

bool
CsrfEngine::CheckMac(CsrfGuard::Role role, const CsrfValue &value) const noexcept
{
	const auto expected = ComputeMac(role, value.nonce, value.issued_at);
	return sodium_memcmp(expected.data(), value.mac.data(),
			     expected.size()) == 0;
}

bool
CsrfEngine::IsFresh(std::chrono::system_clock::time_point issued_at,
		    std::chrono::system_clock::time_point now) const noexcept
{
	/* a pair from the future has not been issued by us */
	return issued_at <= now && now - issued_at <= duration;
}

std::pair<CsrfCookie, CsrfToken>
CsrfEngine::GeneratePair(std::chrono::system_clock::time_point now) const noexcept
{
	CsrfCookie cookie;
	randombytes_buf(cookie.nonce.data(), cookie.nonce.size());
	cookie.issued_at = CsrfValue::ExportTime(CsrfValue::ImportTime(now));
	cookie.mac = ComputeMac(CsrfGuard::Role::COOKIE, cookie.nonce,
				cookie.issued_at);

	return {cookie, MakeToken(cookie)};
}

CsrfToken
CsrfEngine::MakeToken(const CsrfCookie &cookie) const noexcept
{
	CsrfToken token;
	token.nonce = cookie.nonce;
	token.issued_at = cookie.issued_at;
	token.mac = ComputeMac(CsrfGuard::Role::TOKEN, token.nonce,
			       token.issued_at);
	return token;
}

std::optional<CsrfCookie>
CsrfEngine::ParseCookie(std::string_view s) noexcept
{
	CsrfCookie cookie;
	if (!cookie.Parse(s))
		return std::nullopt;

	return cookie;
}

std::optional<CsrfToken>
CsrfEngine::ParseToken(std::string_view s) noexcept
{
	CsrfToken token;
	if (!token.Parse(s))
		return std::nullopt;

	return token;
}

CsrfResult
CsrfEngine::CheckCookie(const CsrfCookie &cookie,
			std::chrono::system_clock::time_point now) const noexcept
{
	if (!CheckMac(CsrfGuard::Role::COOKIE, cookie))
		return CsrfResult::INVALID_MAC;

	if (!IsFresh(cookie.issued_at, now))
		return CsrfResult::EXPIRED;

	return CsrfResult::OK;
}

CsrfResult
CsrfEngine::CheckTokenPair(const CsrfToken &token, const CsrfCookie &cookie,
			   std::chrono::system_clock::time_point now) const noexcept
{
	if (!CheckMac(CsrfGuard::Role::COOKIE, cookie) ||
	    !CheckMac(CsrfGuard::Role::TOKEN, token))
		return CsrfResult::INVALID_MAC;

	/* the token's MAC must be the one derived from the cookie's
	   nonce and issue time */
	const auto expected = ComputeMac(CsrfGuard::Role::TOKEN,
					 cookie.nonce, cookie.issued_at);
	if (sodium_memcmp(expected.data(), token.mac.data(),
			  expected.size()) != 0)
		return CsrfResult::MISMATCH;

	if (!IsFresh(cookie.issued_at, now))
		return CsrfResult::EXPIRED;

	return CsrfResult::OK;
}

CsrfResult
CsrfEngine::CheckTokenPair(std::string_view token, std::string_view cookie,
			   std::chrono::system_clock::time_point now) const noexcept
{
	const auto t = ParseToken(token);
	const auto c = ParseCookie(cookie);
	if (!t || !c)
		return CsrfResult::MALFORMED;

	return CheckTokenPair(*t, *c, now);
}
