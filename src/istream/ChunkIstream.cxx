// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ChunkIstream.hxx"
#include "ForwardIstream.hxx"
#include "UnusedPtr.hxx"
#include "New.hxx"

class ChunkIstream final : public ForwardIstream {
	const std::size_t max_chunk;

public:
	ChunkIstream(UnusedIstreamPtr &&_input, std::size_t _max_chunk) noexcept
		:ForwardIstream(std::move(_input)), max_chunk(_max_chunk) {}

	/* virtual methods from class Istream */

	IstreamLength _GetLength() noexcept override {
		auto result = ForwardIstream::_GetLength();
		if (result.length > max_chunk) {
			result.length = max_chunk;
			result.exhaustive = false;
		}

		return result;
	}

	/* virtual methods from class IstreamHandler */

	std::size_t OnData(std::span<const std::byte> src) noexcept override {
		if (src.size() > max_chunk)
			src = src.first(max_chunk);

		return ForwardIstream::OnData(src);
	}
};

UnusedIstreamPtr
NewChunkIstream(UnusedIstreamPtr input, std::size_t max_chunk) noexcept
{
	assert(max_chunk > 0);

	return NewIstreamPtr<ChunkIstream>(std::move(input), max_chunk);
}
