// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

class UnusedIstreamPtr;

/**
 * An #Istream which delivers a copy of the given string.
 */
UnusedIstreamPtr
istream_string_new(std::string s) noexcept;
