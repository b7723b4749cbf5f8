// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sodium/crypto_generichash.h>

#include <array>
#include <cassert>
#include <cstddef>
#include <span>

/**
 * C++ wrapper for libsodium's crypto_generichash (BLAKE2b), keyed or
 * unkeyed.
 */
class GenericHashState {
	crypto_generichash_state state;

public:
	/**
	 * @param outlen the size of the digest; must be between
	 * crypto_generichash_BYTES_MIN and crypto_generichash_BYTES_MAX
	 * @param key an optional key; if not empty, its size must be
	 * between crypto_generichash_KEYBYTES_MIN and
	 * crypto_generichash_KEYBYTES_MAX
	 */
	explicit GenericHashState(std::size_t outlen,
				  std::span<const std::byte> key={}) noexcept {
		assert(outlen >= crypto_generichash_BYTES_MIN);
		assert(outlen <= crypto_generichash_BYTES_MAX);
		assert(key.empty() || key.size() >= crypto_generichash_KEYBYTES_MIN);
		assert(key.size() <= crypto_generichash_KEYBYTES_MAX);

		[[maybe_unused]] const int result =
			crypto_generichash_init(&state,
						reinterpret_cast<const unsigned char *>(key.data()),
						key.size(), outlen);
		assert(result == 0);
	}

	GenericHashState(const GenericHashState &) = delete;
	GenericHashState &operator=(const GenericHashState &) = delete;

	void Update(std::span<const std::byte> p) noexcept {
		crypto_generichash_update(&state,
					  reinterpret_cast<const unsigned char *>(p.data()),
					  p.size());
	}

	template<typename T>
	void UpdateT(const T &p) noexcept {
		Update(std::as_bytes(std::span{&p, 1}));
	}

	/**
	 * @param out a buffer of exactly the size which was passed
	 * to the constructor
	 */
	void Final(std::span<std::byte> out) noexcept {
		[[maybe_unused]] const int result =
			crypto_generichash_final(&state,
						 reinterpret_cast<unsigned char *>(out.data()),
						 out.size());
		assert(result == 0);
	}

	template<std::size_t size>
	std::array<std::byte, size> GetFinalT() noexcept {
		std::array<std::byte, size> result;
		Final(result);
		return result;
	}
};
