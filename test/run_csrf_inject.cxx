// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Insert the hidden token input into all forms of the HTML document
 * read from stdin, and write the result to stdout.
 */

#include "csrf/InjectIstream.hxx"
#include "csrf/Engine.hxx"
#include "csrf/Key.hxx"
#include "istream/FdIstream.hxx"
#include "istream/Reader.hxx"
#include "istream/UnusedPtr.hxx"
#include "Logger.hxx"

#include <chrono>
#include <cstddef>
#include <string>
#include <system_error>

#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <unistd.h>

static void
WriteFull(int fd, std::span<const std::byte> src)
{
	while (!src.empty()) {
		const auto nbytes = write(fd, src.data(), src.size());
		if (nbytes < 0)
			throw std::system_error(errno, std::system_category(),
						"Failed to write");

		src = src.subspan(nbytes);
	}
}

int
main(int argc, char **argv)
try {
	std::string token;

	if (argc == 2) {
		token = argv[1];
	} else if (argc == 1) {
		/* no token given: generate one with a random key */
		CsrfKey key;
		const CsrfEngine engine(key, std::chrono::hours(1));
		key.Generate();
		token = engine.GeneratePair(std::chrono::system_clock::now()).second.ToString();
	} else {
		fprintf(stderr, "usage: %s [TOKEN]\n", argv[0]);
		return EXIT_FAILURE;
	}

	IstreamReader reader(NewCsrfInjectIstream(NewFdIstream(STDIN_FILENO),
						  token));

	std::byte buffer[8192];
	std::size_t nbytes;
	while ((nbytes = reader.Read(buffer)) > 0)
		WriteFull(STDOUT_FILENO, std::span{buffer}.first(nbytes));

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
