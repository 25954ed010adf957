// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Identification strings of the media-cache daemon.
 */

#pragma once

#define MEDIA_CACHE_SOFTWARE "MediaCache"
#define MEDIA_CACHE_VERSION "1.0"
#define MEDIA_CACHE_URL "https://github.com/ShittyKopper/mediacache"
