// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parse command line options.
 */

#pragma once

/**
 * Parse the command line and set the log level.  Exits the process
 * on "--help", "--version" and on errors.
 */
void
ParseCommandLine(int argc, char **argv);
