// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

/**
 * Initialize libCURL for the lifetime of this object.  Create one
 * instance in main() before any other thread is started.
 */
class ScopeCurlInit {
public:
	ScopeCurlInit() {
		CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (code != CURLE_OK)
			throw Curl::MakeError(code, "CURL initialization failed");
	}

	~ScopeCurlInit() noexcept {
		curl_global_cleanup();
	}

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};
