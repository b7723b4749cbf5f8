// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "IstreamFilterTest.hxx"

#include <cassert>

void
Context::WaitForEndOfStream() noexcept
{
	/* an upper bound for the number of Read() calls, to detect
	   streams which stall */
	unsigned limit = 1024 * 1024;

	while (!eof) {
		ASSERT_TRUE(HasInput());
		ASSERT_GT(limit--, 0U);

		ReadInput();
	}

	ASSERT_FALSE(HasInput());
}

/*
 * istream handler
 *
 */

std::size_t
Context::OnData(const std::span<const std::byte> src) noexcept
{
	std::size_t length = src.size();

	got_data = true;

	if (block_byte) {
		block_byte_state = !block_byte_state;
		if (block_byte_state)
			return 0;
	}

	if (half && length > 8)
		length = (length + 1) / 2;

	if (block_after >= 0) {
		--block_after;
		if (block_after == -1)
			/* block once */
			return 0;
	}

	if (expected_result && record) {
		assert(buffer.size() == offset);
		assert(offset + length <= strlen(expected_result));
		assert(memcmp(expected_result + offset,
			      src.data(), length) == 0);

		buffer.append((const char *)src.data(), length);
	}

	offset += length;

	if (close_after >= 0 && offset >= std::size_t(close_after)) {
		CloseInput();
		eof = true;
		return 0;
	}

	return length;
}

void
Context::OnEof() noexcept
{
	ClearInput();

	eof = true;
}

void
Context::OnError(std::exception_ptr ep) noexcept
{
	assert(!expected_result || !record);

	ClearInput();

	error = std::move(ep);
	eof = true;
}
