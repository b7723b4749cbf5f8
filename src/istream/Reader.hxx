// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Sink.hxx"

#include <cstddef>
#include <exception>
#include <span>

/**
 * Adapter which allows pulling data from an #Istream into a buffer
 * owned by the caller.  Only as much data as fits into the caller's
 * buffer is consumed from the #Istream; the rest stays there
 * (back-pressure), so memory usage does not depend on the stream
 * size.
 *
 * The #Istream must not block: each Istream::Read() call must either
 * submit data to its handler, consume data from its own input or
 * end the stream.
 */
class IstreamReader final : IstreamSink {
	/**
	 * The caller's buffer during Read(); empty otherwise, which
	 * makes OnData() block.
	 */
	std::span<std::byte> dest;

	std::size_t position;

	std::exception_ptr error;

public:
	explicit IstreamReader(UnusedIstreamPtr &&_input) noexcept
		:IstreamSink(std::move(_input)) {}

	/**
	 * Has the input ended successfully, and were all data
	 * delivered?
	 */
	bool IsEof() const noexcept {
		return !HasInput() && !error;
	}

	/**
	 * Copy data from the #Istream into the given buffer.
	 *
	 * Throws the error reported by the #Istream (once all data
	 * before it has been delivered).
	 *
	 * @return the number of bytes copied; 0 means end-of-file
	 */
	std::size_t Read(std::span<std::byte> buffer);

private:
	/* virtual methods from class IstreamHandler */
	std::size_t OnData(std::span<const std::byte> src) noexcept override;
	void OnEof() noexcept override;
	void OnError(std::exception_ptr ep) noexcept override;
};
