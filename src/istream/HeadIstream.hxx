// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>

class UnusedIstreamPtr;

/**
 * This istream filter passes only the first N bytes and then reports
 * end-of-file, closing its input.
 */
UnusedIstreamPtr
istream_head_new(UnusedIstreamPtr input, std::size_t size) noexcept;
