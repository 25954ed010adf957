// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "io/Logger.hxx"
#include "media-cache/Version.hxx"

#include <fmt/core.h>

#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>

static void
PrintUsage()
{
	puts("usage: media-cache [options]\n\n"
	     "valid options:\n"
	     " --help\n"
	     " -h             help (this text)\n"
	     " --version\n"
	     " -V             show media-cache version\n"
	     " --verbose\n"
	     " -v             be more verbose\n"
	     " --quiet\n"
	     " -q             be quiet\n"
	     "\n"
	     "The configuration is read from CACHE_* environment variables:\n"
	     " CACHE_LISTEN CACHE_DIR CACHE_UPSTREAM CACHE_PREFIX\n"
	     " CACHE_REPLY_403 CACHE_REPLY_404 CACHE_REPLY_500 CACHE_REPLY_503\n"
	     " CACHE_REPLY_504 CACHE_PRINT_STATS CACHE_MAX_FILES\n"
	     " CACHE_MAX_SIZE_MB CACHE_MAX_AGE_HOURS CACHE_CLEAN CACHE_DRY_RUN\n"
	     " CACHE_KEY_QUERY CACHE_HASH_KEYS CACHE_WORKERS\n"
	     );
}

[[noreturn]]
static void
ArgError(const char *argv0, const char *msg)
{
	if (msg != nullptr)
		fmt::print(stderr, "{}: {}\n", argv0, msg);

	fmt::print(stderr, "Try '{} --help' for more information.\n", argv0);
	exit(EXIT_FAILURE);
}

void
ParseCommandLine(int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{nullptr, 0, nullptr, 0}
	};

	/* level 2 includes the statistics reports and the janitor's
	   notices */
	unsigned verbose = 2;

	while (true) {
		int option_index = 0;
		int ret = getopt_long(argc, argv, "hVvq",
				      long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(EXIT_SUCCESS);

		case 'V':
			printf(MEDIA_CACHE_SOFTWARE " " MEDIA_CACHE_VERSION "\n");
			exit(EXIT_SUCCESS);

		case 'v':
			++verbose;
			break;

		case 'q':
			if (verbose > 0)
				--verbose;
			break;

		case '?':
			ArgError(argv[0], nullptr);

		default:
			exit(EXIT_FAILURE);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (optind < argc)
		ArgError(argv[0],
			 fmt::format("unrecognized argument: {}", argv[optind]).c_str());
}
