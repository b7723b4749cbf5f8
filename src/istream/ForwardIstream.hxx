// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FacadeIstream.hxx"

/**
 * A #FacadeIstream which forwards everything unmodified; subclasses
 * override only what they want to change.
 */
class ForwardIstream : public FacadeIstream {
protected:
	explicit ForwardIstream(UnusedIstreamPtr &&_input) noexcept
		:FacadeIstream(std::move(_input)) {}

public:
	/* virtual methods from class Istream */

	IstreamLength _GetLength() noexcept override {
		return GetInputLength();
	}

	void _Read() noexcept override {
		ReadInput();
	}

	void _Close() noexcept override {
		CloseInput();
		Destroy();
	}

	/* virtual methods from class IstreamHandler */

	std::size_t OnData(std::span<const std::byte> src) noexcept override;
	void OnEof() noexcept override;
	void OnError(std::exception_ptr ep) noexcept override;
};
