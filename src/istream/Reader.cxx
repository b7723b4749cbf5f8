// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Reader.hxx"

#include <algorithm>
#include <cassert>

#include <string.h>

std::size_t
IstreamReader::Read(std::span<std::byte> buffer)
{
	assert(!buffer.empty());

	if (error)
		std::rethrow_exception(std::exchange(error, {}));

	dest = buffer;
	position = 0;

	while (HasInput() && position == 0)
		ReadInput();

	dest = {};

	if (position == 0 && error)
		std::rethrow_exception(std::exchange(error, {}));

	return position;
}

std::size_t
IstreamReader::OnData(std::span<const std::byte> src) noexcept
{

	const std::size_t nbytes = std::min(src.size(),
					    dest.size() - position);
	if (nbytes > 0) {
		memcpy(dest.data() + position, src.data(), nbytes);
		position += nbytes;
	}

	return nbytes;
}

void
IstreamReader::OnEof() noexcept
{
	ClearInput();
}

void
IstreamReader::OnError(std::exception_ptr ep) noexcept
{
	ClearInput();
	error = std::move(ep);
}
