// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Decode standard base64 (with padding).
 *
 * @return true on success, false if the string is malformed or does
 * not decode to exactly dest.size() bytes
 */
bool
DecodeBase64(std::span<std::byte> dest, std::string_view src) noexcept;

/**
 * Decode URL-safe base64 without padding.
 *
 * @return true on success, false if the string is malformed or does
 * not decode to exactly dest.size() bytes
 */
bool
DecodeUrlSafeBase64(std::span<std::byte> dest, std::string_view src) noexcept;
