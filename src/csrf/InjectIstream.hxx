// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

class UnusedIstreamPtr;

/**
 * An istream filter which inserts a hidden "csrf-token" input
 * element after the closing '>' of every "<form" tag (matched
 * case-insensitively, followed by whitespace, '>' or '/').  All other
 * bytes are passed through unmodified; the output does not depend on
 * how the input is chunked.
 *
 * @param token the base64url-encoded token
 */
UnusedIstreamPtr
NewCsrfInjectIstream(UnusedIstreamPtr input, std::string_view token) noexcept;

/**
 * Apply the same transformation as NewCsrfInjectIstream() to a
 * complete body which is already in memory.
 */
std::string
CsrfInjectBuffer(std::string_view body, std::string_view token);
