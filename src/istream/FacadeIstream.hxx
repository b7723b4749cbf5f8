// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "istream.hxx"
#include "Sink.hxx"

/**
 * Base class for #Istream filters: it is an #Istream to its own
 * handler and an #IstreamHandler to its input.
 */
class FacadeIstream : public Istream, protected IstreamSink {
protected:
	explicit FacadeIstream(UnusedIstreamPtr &&_input) noexcept
		:IstreamSink(std::move(_input)) {}

	FacadeIstream() noexcept = default;
};
