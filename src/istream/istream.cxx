// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "istream.hxx"
#include "Handler.hxx"
#include "UnusedPtr.hxx"

Istream::~Istream() noexcept = default;

std::size_t
Istream::InvokeData(std::span<const std::byte> src) noexcept
{
	assert(handler != nullptr);
	assert(src.data() != nullptr);
	assert(!src.empty());
	assert(!in_data);
	assert(!eof);

#ifndef NDEBUG
	const DestructObserver destructed(*this);
	in_data = true;
#endif

	std::size_t nbytes = handler->OnData(src);
	assert(nbytes <= src.size());

#ifndef NDEBUG
	if (destructed) {
		assert(nbytes == 0);
		return nbytes;
	}

	in_data = false;
#endif

	return nbytes;
}

IstreamHandler &
Istream::PrepareEof() noexcept
{
	assert(!eof);
	assert(handler != nullptr);

#ifndef NDEBUG
	eof = true;
#endif

	return *handler;
}

void
Istream::InvokeEof() noexcept
{
	PrepareEof().OnEof();
}

void
Istream::DestroyEof() noexcept
{
	auto &_handler = PrepareEof();
	Destroy();
	_handler.OnEof();
}

IstreamHandler &
Istream::PrepareError() noexcept
{
	assert(!eof);
	assert(handler != nullptr);

#ifndef NDEBUG
	eof = true;
#endif

	return *handler;
}

void
Istream::InvokeError(std::exception_ptr ep) noexcept
{
	assert(ep);

	PrepareError().OnError(std::move(ep));
}

void
Istream::DestroyError(std::exception_ptr ep) noexcept
{
	auto &_handler = PrepareError();
	Destroy();
	_handler.OnError(std::move(ep));
}

IstreamLength
UnusedIstreamPtr::GetLength() const noexcept
{
	assert(stream != nullptr);

	return stream->GetLength();
}

void
UnusedIstreamPtr::Close(Istream &i) noexcept
{
	i.Close();
}
