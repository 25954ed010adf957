// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueSocketDescriptor.hxx"

/**
 * Create a listening TCP socket bound to the given address (see
 * ResolveListen()).  All resolved addresses are tried in order; the
 * first one which can be bound wins.
 *
 * Throws on error.
 */
UniqueSocketDescriptor
CreateListener(const char *listen, int backlog=256);
