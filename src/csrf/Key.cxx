// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Key.hxx"
#include "crypto/Base64.hxx"

#include <sodium/randombytes.h>

void
CsrfKey::Generate() noexcept
{
	randombytes_buf(data.data(), data.size());
}

bool
CsrfKey::ParseBase64(std::string_view s) noexcept
{
	std::array<std::byte, CsrfGuard::KEY_SIZE> tmp;
	if (!DecodeBase64(tmp, s))
		return false;

	data = tmp;
	return true;
}
