// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "csrf-guard/Protocol.hxx"

#include <array>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * The common part of #CsrfCookie and #CsrfToken: a random nonce, the
 * time it was issued and a MAC.  The MAC is not verified here; see
 * #CsrfEngine.
 */
struct CsrfValue {
	using Nonce = std::array<std::byte, CsrfGuard::NONCE_SIZE>;
	using Mac = std::array<std::byte, CsrfGuard::MAC_SIZE>;

	static constexpr std::size_t WIRE_SIZE = CsrfGuard::WIRE_SIZE;
	static constexpr std::size_t STRING_LENGTH = CsrfGuard::STRING_LENGTH;

	Nonce nonce;

	/**
	 * Whole seconds; fractions are cut off by Generate().
	 */
	std::chrono::system_clock::time_point issued_at;

	Mac mac;

	static constexpr uint64_t ImportTime(std::chrono::system_clock::time_point t) noexcept {
		return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
	}

	static constexpr std::chrono::system_clock::time_point ExportTime(uint64_t t) noexcept {
		return std::chrono::system_clock::time_point(std::chrono::seconds(t));
	}

	/**
	 * Can the given timestamp be represented as a
	 * std::chrono::system_clock::time_point?
	 */
	static constexpr bool IsValidTime(uint64_t t) noexcept {
		using namespace std::chrono;
		return t <= uint64_t(duration_cast<seconds>(system_clock::time_point::max().time_since_epoch()).count());
	}

	/**
	 * Write the fixed-layout binary representation: nonce, 64 bit
	 * big-endian issue time, MAC.
	 */
	void Serialize(std::span<std::byte, WIRE_SIZE> dest) const noexcept;

	/**
	 * Decode the fixed-layout binary representation.
	 *
	 * @return false if the size is wrong or the timestamp is out
	 * of range
	 */
	bool Deserialize(std::span<const std::byte> src) noexcept;

	/**
	 * Format as base64url without padding.
	 *
	 * @param s a buffer of at least STRING_LENGTH+1 bytes
	 */
	void Format(char *s) const noexcept;

	std::string ToString() const;

	/**
	 * Parse the base64url representation.
	 *
	 * @return true on success
	 */
	bool Parse(std::string_view s) noexcept;
};

/**
 * The half of the pair which is sent to the client in a cookie.
 */
struct CsrfCookie : CsrfValue {};

/**
 * The half of the pair which is embedded in forms and submitted in
 * the request body.
 */
struct CsrfToken : CsrfValue {};
