// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <stdio.h>

namespace LoggerDetail {

unsigned max_level = 2;

void
WriteV(std::string_view domain, std::string_view message) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", message);
	else
		fmt::print(stderr, "[{}] {}\n", domain, message);
}

void
AppendArg(fmt::memory_buffer &buffer, std::exception_ptr ep) noexcept
{
	const auto msg = GetFullMessage(std::move(ep));
	buffer.append(std::string_view{msg});
}

} // namespace LoggerDetail

static void
AppendNestedMessage(std::string &dest, const std::exception &e) noexcept
{
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		dest += ": ";
		dest += nested.what();
		AppendNestedMessage(dest, nested);
	} catch (...) {
		dest += ": Unrecognized nested exception";
	}
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		std::string result = e.what();
		AppendNestedMessage(result, e);
		return result;
	} catch (const char *s) {
		return s;
	} catch (...) {
		return "Unrecognized exception";
	}
}

void
PrintException(std::exception_ptr ep) noexcept
{
	fmt::print(stderr, "{}\n", GetFullMessage(std::move(ep)));
}
