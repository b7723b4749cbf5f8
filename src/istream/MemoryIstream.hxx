// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "istream.hxx"

#include <span>

/**
 * An #Istream which delivers a buffer that is owned by somebody
 * else; the buffer must remain valid until the #Istream ends.
 */
class MemoryIstream : public Istream {
	std::span<const std::byte> data;

public:
	explicit MemoryIstream(std::span<const std::byte> _data) noexcept
		:data(_data) {}

protected:
	void SetData(std::span<const std::byte> _data) noexcept {
		data = _data;
	}

public:
	/* virtual methods from class Istream */

	IstreamLength _GetLength() noexcept override {
		return {
			.length = data.size(),
			.exhaustive = true,
		};
	}

	void _Read() noexcept override;
};
