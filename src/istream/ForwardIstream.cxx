// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ForwardIstream.hxx"

std::size_t
ForwardIstream::OnData(std::span<const std::byte> src) noexcept
{
	return InvokeData(src);
}

void
ForwardIstream::OnEof() noexcept
{
	ClearInput();
	DestroyEof();
}

void
ForwardIstream::OnError(std::exception_ptr ep) noexcept
{
	ClearInput();
	DestroyError(std::move(ep));
}
