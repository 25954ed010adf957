// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "http_server/Server.hxx"
#include "lib/curl/Init.hxx"
#include "net/ServerSocket.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "system/Error.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"
#include "media-cache/Version.hxx"

#include <sodium/core.h>

#include <fmt/ranges.h>

#include <signal.h>
#include <stdlib.h>

/**
 * Block the signals we want to receive with sigwait(), before any
 * thread is started, so all threads inherit the mask.
 */
static sigset_t
BlockSignals()
{
	sigset_t mask;
	sigemptyset(&mask);
	sigaddset(&mask, SIGINT);
	sigaddset(&mask, SIGTERM);
	sigaddset(&mask, SIGPIPE);

	if (int error = pthread_sigmask(SIG_BLOCK, &mask, nullptr); error != 0)
		throw MakeErrno(error, "pthread_sigmask() failed");

	sigdelset(&mask, SIGPIPE);
	return mask;
}

static void
WaitForShutdown(const sigset_t &mask)
{
	while (true) {
		int sig;
		if (int error = sigwait(&mask, &sig); error != 0)
			throw MakeErrno(error, "sigwait() failed");

		if (sig == SIGINT || sig == SIGTERM) {
			LogConcat(2, "main", "caught signal ", sig,
				  ", shutting down");
			return;
		}
	}
}

int main(int argc, char **argv)
try {
	ParseCommandLine(argc, argv);

	McConfig config;
	LoadEnvironment(config);
	Check(config);

	if (sodium_init() < 0)
		throw "libsodium initialization failed";

	const ScopeCurlInit curl_init;

	const auto signal_mask = BlockSignals();

	McInstance instance(config);
	instance.store.CreateDirectory();

	LogFmt(2, "main", "{} {} listening on {}",
	       MEDIA_CACHE_SOFTWARE, MEDIA_CACHE_VERSION, config.listen);
	LogFmt(2, "main", "upstreams: {}", config.upstreams);
	LogFmt(2, "main", "cache directory: {}, key prefix: {}",
	       config.cache_dir, config.key.prefix);

	HttpServer server(instance, CreateListener(config.listen.c_str()));
	server.Start(config.workers);

	instance.janitor.Start();

	WaitForShutdown(signal_mask);

	server.Stop();
	instance.janitor.Stop();
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
