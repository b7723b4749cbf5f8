// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "csrf-guard/Protocol.hxx"

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

/**
 * The secret key which authenticates cookies and tokens.  It is
 * created once at startup and passed by reference to everybody who
 * needs it.
 */
class CsrfKey {
	std::array<std::byte, CsrfGuard::KEY_SIZE> data;

public:
	/**
	 * Construct an all-zero key.  Only useful for tests and as a
	 * target for Generate() or ParseBase64().
	 */
	constexpr CsrfKey() noexcept
		:data{} {}

	explicit constexpr CsrfKey(const std::array<std::byte, CsrfGuard::KEY_SIZE> &_data) noexcept
		:data(_data) {}

	/**
	 * Fill the key with random bytes.  SodiumInit() must have been
	 * called.
	 */
	void Generate() noexcept;

	/**
	 * Parse a standard base64 string (with padding) which must
	 * decode to exactly #KEY_SIZE bytes.
	 *
	 * @return true on success
	 */
	bool ParseBase64(std::string_view s) noexcept;

	constexpr std::span<const std::byte, CsrfGuard::KEY_SIZE> GetSpan() const noexcept {
		return data;
	}

	bool operator==(const CsrfKey &other) const noexcept {
		return data == other.data;
	}
};
