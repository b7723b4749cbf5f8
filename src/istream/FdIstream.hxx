// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class UnusedIstreamPtr;

/**
 * An #Istream which reads from a file descriptor.  Reads are
 * blocking; this is meant for command-line tools.  The file
 * descriptor is not closed.
 */
UnusedIstreamPtr
NewFdIstream(int fd) noexcept;
