// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escape and unescape in URI style ('%20').
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

/**
 * @param dest a buffer of at least 3 * src.size() bytes
 * @return the length of the escaped string
 */
std::size_t
UriEscape(char *dest, std::string_view src, char escape_char='%') noexcept;

std::string
UriEscape(std::string_view src, char escape_char='%');

/**
 * Unescape the given string into the buffer (which must be at least
 * src.size() bytes large).  A "%00" is refused, because it could
 * truncate strings in other layers.
 *
 * @return the end of the unescaped string or nullptr on error
 * (malformed escape sequence)
 */
char *
UriUnescape(char *dest, std::string_view src, char escape_char='%') noexcept;

std::optional<std::string>
UriUnescape(std::string_view src, char escape_char='%');
