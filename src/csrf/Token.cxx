// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Token.hxx"
#include "crypto/Base64.hxx"

#include <sodium/utils.h>

#include <algorithm>

static std::byte *
SerializeBigEndian(std::byte *dest, uint64_t value) noexcept
{
	for (int shift = 56; shift >= 0; shift -= 8)
		*dest++ = static_cast<std::byte>(value >> shift);
	return dest;
}

static uint64_t
DeserializeBigEndian(const std::byte *src) noexcept
{
	uint64_t value = 0;
	for (unsigned i = 0; i < 8; ++i)
		value = (value << 8) | static_cast<uint64_t>(src[i]);
	return value;
}

void
CsrfValue::Serialize(std::span<std::byte, WIRE_SIZE> dest) const noexcept
{
	std::byte *p = dest.data();
	p = std::copy(nonce.begin(), nonce.end(), p);
	p = SerializeBigEndian(p, ImportTime(issued_at));
	std::copy(mac.begin(), mac.end(), p);
}

bool
CsrfValue::Deserialize(std::span<const std::byte> src) noexcept
{
	if (src.size() != WIRE_SIZE)
		return false;

	const std::byte *p = src.data();

	const uint64_t t = DeserializeBigEndian(p + nonce.size());
	if (!IsValidTime(t))
		return false;

	std::copy_n(p, nonce.size(), nonce.begin());
	issued_at = ExportTime(t);
	std::copy_n(p + nonce.size() + sizeof(t), mac.size(), mac.begin());
	return true;
}

void
CsrfValue::Format(char *s) const noexcept
{
	std::array<std::byte, WIRE_SIZE> buffer;
	Serialize(buffer);

	sodium_bin2base64(s, STRING_LENGTH + 1,
			  reinterpret_cast<const unsigned char *>(buffer.data()),
			  buffer.size(),
			  sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::string
CsrfValue::ToString() const
{
	char buffer[STRING_LENGTH + 1];
	Format(buffer);
	return {buffer, STRING_LENGTH};
}

bool
CsrfValue::Parse(std::string_view s) noexcept
{
	if (s.size() != STRING_LENGTH)
		return false;

	std::array<std::byte, WIRE_SIZE> buffer;
	if (!DecodeUrlSafeBase64(buffer, s))
		return false;

	return Deserialize(buffer);
}
