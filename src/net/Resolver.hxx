// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "AddressInfo.hxx"

/**
 * Thin wrapper for getaddrinfo() which throws on error.
 *
 * @param node the host name or numeric address; nullptr means the
 * wildcard address
 */
AddressInfoList
Resolve(const char *node, const char *service,
	const struct addrinfo *hints);

/**
 * Resolve a listener specification like ":3333", "host:port" or
 * "[::1]:port" with AI_PASSIVE.  An empty host means all interfaces.
 */
AddressInfoList
ResolveListen(const char *listen);
