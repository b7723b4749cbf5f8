// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DestructObserver.hxx"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <exception> // for std::exception_ptr
#include <span>

class IstreamHandler;

/**
 * The (remaining) length of an #Istream, as far as it is known.
 */
struct IstreamLength {
	/**
	 * Non-negative number of bytes which will be
	 * available in this #Istream (eventually).
	 */
	uint_least64_t length;

	/**
	 * True if the #Istream ends after #length bytes.  False if
	 * an unknown number of bytes may follow (maybe zero).
	 */
	bool exhaustive;

	constexpr IstreamLength &operator+=(const IstreamLength &other) noexcept {
		length += other.length;
		exhaustive = exhaustive && other.exhaustive;
		return *this;
	}
};

/**
 * An input stream which pushes data to its #IstreamHandler
 * whenever the handler asks for it by calling Read().  The handler
 * applies back-pressure by consuming less than it was offered.
 *
 * Instances are allocated with "new" (see NewIstreamPtr()), and the
 * lifetime of an #Istream begins when it is created, and ends with
 * one of the following events:
 *
 * - it is closed manually using Close()
 * - it has reached end-of-file (when IstreamHandler::OnEof() is called)
 * - an error has occurred (when IstreamHandler::OnError() is called)
 */
class Istream : public DestructAnchor {
	/** data sink */
	IstreamHandler *handler = nullptr;

#ifndef NDEBUG
	bool reading = false, in_data = false, eof = false;
#endif

protected:
	Istream() noexcept = default;

	Istream(const Istream &) = delete;
	Istream &operator=(const Istream &) = delete;

	virtual ~Istream() noexcept;

	std::size_t InvokeData(std::span<const std::byte> src) noexcept;
	void InvokeEof() noexcept;
	void InvokeError(std::exception_ptr ep) noexcept;

	/**
	 * Prepare a call to IstreamHandler::OnEof(); the caller is
	 * responsible for actually calling it.
	 */
	IstreamHandler &PrepareEof() noexcept;

	/**
	 * Prepare a call to IstreamHandler::OnError(); the caller is
	 * response for actually calling it.
	 */
	IstreamHandler &PrepareError() noexcept;

	void Destroy() noexcept {
		delete this;
	}

	void DestroyEof() noexcept;
	void DestroyError(std::exception_ptr ep) noexcept;

public:
	bool HasHandler() const noexcept {
		return handler != nullptr;
	}

	void SetHandler(IstreamHandler &_handler) noexcept {
		handler = &_handler;
	}

	/**
	 * Detach the handler from this object.  This should only be done
	 * if it is going to be reattached to a new handler right after
	 * this call.
	 */
	void ClearHandler() noexcept {
		handler = nullptr;
	}

	/**
	 * How long is the remainder of this #Istream?
	 */
	[[gnu::pure]]
	IstreamLength GetLength() noexcept {
		assert(!eof);

		return _GetLength();
	}

	/**
	 * Try to read from the stream.  If the stream can read data
	 * without blocking, it must provide data.  It may invoke the
	 * callbacks any number of times, supposed that the handler itself
	 * doesn't block.
	 *
	 * Whenever the handler reports it is blocking, the responsibility
	 * for calling back (and calling this function) is handed back to
	 * the istream handler.
	 */
	void Read() noexcept {
		assert(handler != nullptr);
		assert(!eof);
		assert(!reading);
		assert(!in_data);

#ifndef NDEBUG
		const DestructObserver destructed(*this);
		reading = true;
#endif

		_Read();

#ifndef NDEBUG
		if (destructed)
			return;

		reading = false;
#endif
	}

	/**
	 * Close the stream and free resources.  This must not be called
	 * after the handler's eof() / abort() callbacks were invoked.
	 */
	void Close() noexcept {
		assert(!eof);

		_Close();
	}

protected:
	virtual IstreamLength _GetLength() noexcept {
		return {0, false};
	}

	virtual void _Read() noexcept = 0;

	virtual void _Close() noexcept {
		Destroy();
	}
};
