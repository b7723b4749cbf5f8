// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>

class UnusedIstreamPtr;

/**
 * This istream filter passes at most #max_chunk bytes at a time, to
 * exercise handlers which must cope with data split at arbitrary
 * positions.
 */
UnusedIstreamPtr
NewChunkIstream(UnusedIstreamPtr input, std::size_t max_chunk) noexcept;
