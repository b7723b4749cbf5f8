// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions for the csrf-guard double-submit cookie protocol.
 */

#ifndef CSRF_GUARD_PROTOCOL_HXX
#define CSRF_GUARD_PROTOCOL_HXX

#include <cstddef>
#include <string_view>

namespace CsrfGuard {

/**
 * The name of the cookie which carries the base64url-encoded
 * cookie half of the pair.
 */
constexpr std::string_view COOKIE_NAME = "csrf";

/**
 * The name of the form field which carries the base64url-encoded
 * token half of the pair.
 */
constexpr std::string_view FORM_FIELD = "csrf-token";

/**
 * The part header which announces the token in a
 * "multipart/form-data" request body.
 */
constexpr std::string_view FORM_FIELD_MULTIPART =
	"Content-Disposition: form-data; name=\"csrf-token\"";

/**
 * The markup which is inserted after each "<form>" tag; the
 * base64url-encoded token goes between #HIDDEN_INPUT_PREFIX and
 * #HIDDEN_INPUT_SUFFIX.
 */
constexpr std::string_view HIDDEN_INPUT_PREFIX =
	"<input type=\"hidden\" name=\"csrf-token\" value=\"";
constexpr std::string_view HIDDEN_INPUT_SUFFIX = "\"/>";

/**
 * Size of the random nonce in bytes.
 */
constexpr std::size_t NONCE_SIZE = 32;

/**
 * Size of the keyed BLAKE2b MAC in bytes.
 */
constexpr std::size_t MAC_SIZE = 32;

/**
 * Size of the secret key in bytes.
 */
constexpr std::size_t KEY_SIZE = 32;

/**
 * Size of an encoded cookie or token: the nonce, the 64 bit
 * big-endian issue time (seconds since the epoch) and the MAC.
 */
constexpr std::size_t WIRE_SIZE = NONCE_SIZE + 8 + MAC_SIZE;

/**
 * Length of the base64url (without padding) representation of
 * #WIRE_SIZE bytes.
 */
constexpr std::size_t STRING_LENGTH = (WIRE_SIZE * 4 + 2) / 3;

static_assert(STRING_LENGTH == 96);

/**
 * The role byte which is hashed in front of the nonce; it makes a
 * cookie's MAC useless as a token's MAC and vice versa.
 */
enum class Role : unsigned char {
	COOKIE = 0x01,
	TOKEN = 0x02,
};

} // namespace CsrfGuard

#endif
