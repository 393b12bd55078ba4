// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "io/Logger.hxx"
#include "config.h"

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <getopt.h>

static void usage(void) {
	puts("usage: wp-cron-runner [options]\n\n"
	     "valid options:\n"
	     " -h             help (this text)\n"
#ifdef __GLIBC__
	     " --version\n"
#endif
	     " -V             show wp-cron-runner version\n"
#ifdef __GLIBC__
	     " --verbose\n"
#endif
	     " -v             be more verbose\n"
#ifdef __GLIBC__
	     " --quiet\n"
#endif
	     " -q             be quiet\n"
#ifdef __GLIBC__
	     " --config PATH\n"
#endif
	     " -c PATH        load this configuration file\n"
	     "\n"
	     );
}

static void arg_error(const char *argv0, const char *fmt, ...)
	__attribute__ ((noreturn))
	__attribute__((format(printf,2,3)));
static void arg_error(const char *argv0, const char *fmt, ...) {
	if (fmt != nullptr) {
		va_list ap;

		fputs(argv0, stderr);
		fputs(": ", stderr);

		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);

		putc('\n', stderr);
	}

	fprintf(stderr, "Try '%s --help' for more information.\n",
		argv0);
	exit(EXIT_FAILURE);
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	int ret;
#ifdef __GLIBC__
	static const struct option long_options[] = {
		{"help", 0, 0, 'h'},
		{"version", 0, 0, 'V'},
		{"verbose", 0, 0, 'v'},
		{"quiet", 0, 0, 'q'},
		{"config", 1, 0, 'c'},
		{0,0,0,0}
	};
#endif

	unsigned log_level = 1;

	while (1) {
#ifdef __GLIBC__
		int option_index = 0;

		ret = getopt_long(argc, argv, "hVvqc:",
				  long_options, &option_index);
#else
		ret = getopt(argc, argv, "hVvqc:");
#endif
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			usage();
			exit(EXIT_SUCCESS);

		case 'V':
			printf(PACKAGE " v%s\n", VERSION);
			exit(EXIT_SUCCESS);

		case 'v':
			++log_level;
			break;

		case 'q':
			log_level = 0;
			break;

		case 'c':
			cmdline.config_path = optarg;
			break;

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(EXIT_FAILURE);
		}
	}

	SetLogLevel(log_level);

	/* check non-option arguments */

	if (optind < argc)
		arg_error(argv[0], "unrecognized argument: %s", argv[optind]);

	return cmdline;
}
