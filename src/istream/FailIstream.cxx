// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FailIstream.hxx"
#include "istream.hxx"
#include "New.hxx"

class FailIstream final : public Istream {
	std::exception_ptr error;

public:
	explicit FailIstream(std::exception_ptr &&_error) noexcept
		:error(std::move(_error)) {}

	/* virtual methods from class Istream */

	void _Read() noexcept override {
		assert(error);
		DestroyError(std::move(error));
	}
};

UnusedIstreamPtr
istream_fail_new(std::exception_ptr ep) noexcept
{
	assert(ep);

	return NewIstreamPtr<FailIstream>(std::move(ep));
}
