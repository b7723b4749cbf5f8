// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>

class UnusedIstreamPtr;

/**
 * istream implementation which produces a failure.
 */
UnusedIstreamPtr
istream_fail_new(std::exception_ptr ep) noexcept;
