// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MemoryIstream.hxx"

void
MemoryIstream::_Read() noexcept
{
	if (!data.empty()) {
		auto nbytes = InvokeData(data);
		if (nbytes == 0)
			return;

		data = data.subspan(nbytes);
	}

	if (data.empty())
		DestroyEof();
}
