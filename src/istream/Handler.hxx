// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <exception>
#include <span>

/** data sink for an istream */
class IstreamHandler {
public:
	/**
	 * Data is available as a buffer.
	 * This function must return 0 if it has closed the stream.
	 *
	 * @param src the buffer, never empty
	 * @return the number of bytes consumed, 0 if writing would block
	 * (caller is responsible for calling Istream::Read() again
	 * later) or if the stream has been closed
	 */
	virtual std::size_t OnData(std::span<const std::byte> src) noexcept = 0;

	/**
	 * End of file encountered.
	 */
	virtual void OnEof() noexcept = 0;

	/**
	 * The istream has ended unexpectedly, e.g. an I/O error.
	 *
	 * The method Istream::Close() will not result in a call to
	 * this callback, since the caller is assumed to be the
	 * istream handler.
	 *
	 * @param error an exception describing the error condition
	 */
	virtual void OnError(std::exception_ptr error) noexcept = 0;

protected:
	~IstreamHandler() noexcept = default;
};
