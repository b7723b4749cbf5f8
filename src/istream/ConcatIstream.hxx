// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UnusedPtr.hxx"

#include <span>

/**
 * Concatenate several istreams.
 */
UnusedIstreamPtr
_NewConcatIstream(std::span<UnusedIstreamPtr> inputs);

template<typename... Args>
auto
NewConcatIstream(Args&&... args)
{
	UnusedIstreamPtr inputs[]{std::forward<Args>(args)...};
	return _NewConcatIstream(inputs);
}
