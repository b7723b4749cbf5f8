// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Base64.hxx"

#include <sodium/utils.h>

static bool
DecodeBase64(std::span<std::byte> dest, std::string_view src,
	     int variant) noexcept
{
	std::size_t length;
	const char *end;

	if (sodium_base642bin(reinterpret_cast<unsigned char *>(dest.data()),
			      dest.size(), src.data(), src.size(),
			      nullptr, &length, &end, variant) != 0)
		return false;

	/* reject trailing garbage and short input */
	return end == src.data() + src.size() && length == dest.size();
}

bool
DecodeBase64(std::span<std::byte> dest, std::string_view src) noexcept
{
	return DecodeBase64(dest, src, sodium_base64_VARIANT_ORIGINAL);
}

bool
DecodeUrlSafeBase64(std::span<std::byte> dest, std::string_view src) noexcept
{
	return DecodeBase64(dest, src, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}
