// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct CsrfConfig;

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error; syntax errors are wrapped in an error which
 * names the file and the line number.
 */
void
LoadCsrfConfigFile(CsrfConfig &config, const char *path);
