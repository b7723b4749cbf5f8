// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "istream.hxx"
#include "Handler.hxx"
#include "UnusedPtr.hxx"

#include <cassert>
#include <utility>

/**
 * An #IstreamHandler which owns its input #Istream: it registers
 * itself as the handler and closes the input when it is destroyed
 * before the input has ended.
 *
 * Implementations must call ClearInput() from OnEof() and OnError(),
 * because the input has already destroyed itself at that point.
 */
class IstreamSink : protected IstreamHandler {
	Istream *input = nullptr;

protected:
	explicit IstreamSink(UnusedIstreamPtr &&_input) noexcept
		:input(_input.Steal())
	{
		if (input != nullptr)
			input->SetHandler(*this);
	}

	IstreamSink(const IstreamSink &) = delete;
	IstreamSink &operator=(const IstreamSink &) = delete;

	~IstreamSink() noexcept {
		if (HasInput())
			CloseInput();
	}

	bool HasInput() const noexcept {
		return input != nullptr;
	}

	void ClearInput() noexcept {
		input = nullptr;
	}

	void CloseInput() noexcept {
		assert(HasInput());

		std::exchange(input, nullptr)->Close();
	}

	void ReadInput() noexcept {
		assert(HasInput());

		input->Read();
	}

	[[gnu::pure]]
	IstreamLength GetInputLength() const noexcept {
		assert(HasInput());

		return input->GetLength();
	}
};
