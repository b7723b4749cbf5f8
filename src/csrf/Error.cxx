// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

using std::string_view_literals::operator""sv;

std::string_view
ToString(CsrfResult result) noexcept
{
	switch (result) {
	case CsrfResult::OK:
		return "ok"sv;

	case CsrfResult::MALFORMED:
		return "malformed"sv;

	case CsrfResult::INVALID_MAC:
		return "invalid MAC"sv;

	case CsrfResult::EXPIRED:
		return "expired"sv;

	case CsrfResult::MISMATCH:
		return "cookie/token mismatch"sv;
	}

	return "unknown"sv;
}
