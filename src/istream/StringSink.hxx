// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <string>

class UnusedIstreamPtr;
class StringSink;

class StringSinkHandler {
public:
	virtual void OnStringSinkSuccess(std::string &&value) noexcept = 0;
	virtual void OnStringSinkError(std::exception_ptr error) noexcept = 0;
};

/**
 * Collect all data of an #Istream into a std::string.  The
 * #StringSink frees itself after it has invoked the handler.
 */
StringSink &
NewStringSink(UnusedIstreamPtr input, StringSinkHandler &handler);

/**
 * Read from the input until it ends.  The input must not block.
 */
void
ReadStringSink(StringSink &sink) noexcept;
