// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "Key.hxx"
#include "Error.hxx"
#include "crypto/Init.hxx"
#include "Logger.hxx"

#include <stdlib.h>

CsrfKey
LoadCsrfKey(const CsrfConfig &config)
{
	CsrfKey key;

	if (!config.secret.empty()) {
		if (!key.ParseBase64(config.secret))
			throw CsrfConfigError("Malformed secret key (expected base64 of 32 bytes)");

		return key;
	}

	const char *env = getenv(CSRF_GUARD_SECRET_KEY_ENV);
	if (env != nullptr) {
		if (key.ParseBase64(env))
			return key;

		LogConcat(1, "csrf", "Ignoring malformed ",
			  CSRF_GUARD_SECRET_KEY_ENV);
	}

	LogConcat(1, "csrf",
		  "No secret key was configured; tokens will be invalidated by a restart");

	SodiumInit();
	key.Generate();
	return key;
}
