// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringIstream.hxx"
#include "MemoryIstream.hxx"
#include "New.hxx"

class StringIstream final : public MemoryIstream {
	/* the buffer referred to by MemoryIstream */
	const std::string value;

public:
	explicit StringIstream(std::string &&_value) noexcept
		:MemoryIstream({}), value(std::move(_value))
	{
		SetData(std::as_bytes(std::span{value}));
	}
};

UnusedIstreamPtr
istream_string_new(std::string s) noexcept
{
	return NewIstreamPtr<StringIstream>(std::move(s));
}
