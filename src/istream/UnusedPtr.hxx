// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef> // for std::nullptr_t
#include <utility>

struct IstreamLength;
class Istream;

/**
 * This class holds a pointer to an unused #Istream and auto-closes
 * it.  It can be moved to other instances, until it is finally
 * "stolen" using Steal() to actually use it.
 */
class UnusedIstreamPtr {
	Istream *stream = nullptr;

public:
	UnusedIstreamPtr() = default;
	UnusedIstreamPtr(std::nullptr_t) noexcept {}

	explicit UnusedIstreamPtr(Istream *_stream) noexcept
		:stream(_stream) {}

	UnusedIstreamPtr(UnusedIstreamPtr &&src) noexcept
		:stream(std::exchange(src.stream, nullptr)) {}

	~UnusedIstreamPtr() noexcept {
		if (stream != nullptr)
			Close(*stream);
	}

	UnusedIstreamPtr &operator=(UnusedIstreamPtr &&src) noexcept {
		using std::swap;
		swap(stream, src.stream);
		return *this;
	}

	operator bool() const noexcept {
		return stream != nullptr;
	}

	Istream *Steal() noexcept {
		return std::exchange(stream, nullptr);
	}

	void Clear() noexcept {
		auto *s = Steal();
		if (s != nullptr)
			Close(*s);
	}

	[[gnu::pure]]
	IstreamLength GetLength() const noexcept;

private:
	static void Close(Istream &i) noexcept;
};
