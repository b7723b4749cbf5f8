// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FdIstream.hxx"
#include "istream.hxx"
#include "New.hxx"

#include <array>
#include <system_error>

#include <errno.h>
#include <unistd.h>

class FdIstream final : public Istream {
	const int fd;

	std::array<std::byte, 8192> buffer;

	/**
	 * The portion of #buffer which has been read from the file
	 * descriptor, but not yet consumed by the handler.
	 */
	std::span<const std::byte> pending{};

public:
	explicit FdIstream(int _fd) noexcept
		:fd(_fd) {}

private:
	/**
	 * Submit #pending to the handler.
	 *
	 * @return false if the handler has blocked or this object has
	 * been destroyed
	 */
	bool SendPending() noexcept {
		const std::size_t nbytes = InvokeData(pending);
		if (nbytes == 0)
			return false;

		pending = pending.subspan(nbytes);
		return pending.empty();
	}

public:
	/* virtual methods from class Istream */

	void _Read() noexcept override {
		if (!pending.empty() && !SendPending())
			return;

		const ssize_t nbytes = read(fd, buffer.data(), buffer.size());
		if (nbytes < 0) {
			DestroyError(std::make_exception_ptr(std::system_error(errno, std::system_category(),
										"Failed to read")));
			return;
		}

		if (nbytes == 0) {
			DestroyEof();
			return;
		}

		pending = std::span{buffer}.first(nbytes);
		SendPending();
	}
};

UnusedIstreamPtr
NewFdIstream(int fd) noexcept
{
	return NewIstreamPtr<FdIstream>(fd);
}
