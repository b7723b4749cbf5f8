// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Initialize libsodium.  This may be called any number of times.
 *
 * Throws on error.
 */
void
SodiumInit();
