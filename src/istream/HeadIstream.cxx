// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HeadIstream.hxx"
#include "ForwardIstream.hxx"
#include "UnusedPtr.hxx"
#include "New.hxx"

#include <algorithm>

class HeadIstream final : public ForwardIstream {
	std::size_t rest;

public:
	HeadIstream(UnusedIstreamPtr &&_input, std::size_t size) noexcept
		:ForwardIstream(std::move(_input)), rest(size) {}

	/* virtual methods from class Istream */

	IstreamLength _GetLength() noexcept override {
		auto result = ForwardIstream::_GetLength();
		if (result.length >= rest) {
			result.length = rest;
			result.exhaustive = true;
		}

		return result;
	}

	void _Read() noexcept override {
		if (rest == 0) {
			CloseInput();
			DestroyEof();
		} else
			ForwardIstream::_Read();
	}

	/* virtual methods from class IstreamHandler */

	std::size_t OnData(std::span<const std::byte> src) noexcept override {
		if (rest == 0) {
			CloseInput();
			DestroyEof();
			return 0;
		}

		if (src.size() > rest)
			src = src.first(rest);

		std::size_t nbytes = InvokeData(src);
		assert(nbytes <= rest);

		if (nbytes > 0) {
			rest -= nbytes;
			if (rest == 0) {
				CloseInput();
				DestroyEof();
				return 0;
			}
		}

		return nbytes;
	}
};

UnusedIstreamPtr
istream_head_new(UnusedIstreamPtr input, std::size_t size) noexcept
{
	return NewIstreamPtr<HeadIstream>(std::move(input), size);
}
