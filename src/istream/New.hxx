// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UnusedPtr.hxx"

#include <utility>

template<typename T, typename... Args>
static inline T *
NewIstream(Args&&... args)
{
	return new T(std::forward<Args>(args)...);
}

template<typename T, typename... Args>
static inline UnusedIstreamPtr
NewIstreamPtr(Args&&... args)
{
	return UnusedIstreamPtr(NewIstream<T>(std::forward<Args>(args)...));
}
