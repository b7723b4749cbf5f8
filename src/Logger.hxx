// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace LoggerDetail {

/**
 * Messages with a level above this one are discarded.  The default
 * shows levels 1 (important warnings) and 2 (errors which are only
 * relevant to one client).
 */
extern unsigned max_level;

[[gnu::pure]]
inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

void
WriteV(std::string_view domain, std::string_view message) noexcept;

inline void
AppendArg(fmt::memory_buffer &buffer, std::string_view value) noexcept
{
	buffer.append(value);
}

void
AppendArg(fmt::memory_buffer &buffer, std::exception_ptr ep) noexcept;

template<typename T>
inline void
AppendArg(fmt::memory_buffer &buffer, const T &value) noexcept
{
	fmt::format_to(std::back_inserter(buffer), "{}", value);
}

} // namespace LoggerDetail

/**
 * Change the verbosity of all loggers.  1 = important warnings only;
 * 5 = debug messages.
 */
inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

/**
 * Return the message of the given exception, including the messages
 * of all nested exceptions.
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

/**
 * Print the given exception (and all of its nested exceptions) to
 * stderr.
 */
void
PrintException(std::exception_ptr ep) noexcept;

/**
 * Concatenate all arguments and log the result.  Arguments may be
 * strings, numbers (anything {fmt} can format) and
 * std::exception_ptr.
 */
template<typename... Args>
void
LogConcat(unsigned level, std::string_view domain, Args&&... args) noexcept
{
	if (!LoggerDetail::CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	(LoggerDetail::AppendArg(buffer, std::forward<Args>(args)), ...);
	LoggerDetail::WriteV(domain, {buffer.data(), buffer.size()});
}

/**
 * A logger with a fixed domain which is printed in front of each
 * message.
 */
class Logger {
	std::string domain;

public:
	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const noexcept {
		LogConcat(level, domain, std::forward<Args>(args)...);
	}
};
