/*
 *	avrforge - The "avrforge" program.
 *	Copyright (C) 2026 The avrforge developers
 *
 *	This program is free software; you can redistribute it and/or modify
 *	it under the terms of the GNU General Public License Version 2
 *	as published by the Free Software Foundation.
 *
 *	This program is distributed in the hope that it will be useful,
 *	but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	GNU General Public License for more details.
 *
 *	You should have received a copy of the GNU General Public License
 *	along with this program; if not, write to the Free Software
 *	Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111, USA.
 *
 * Interface for running external tools.
 */

#ifndef PROCESS_H
#define PROCESS_H

#include <string>
#include <vector>

struct ProcessOptions {
    // Directory the child changes to before exec, nullptr to stay put.
    const char *cwd = nullptr;

    // If set, the child's stdout goes to this file (created/truncated).
    // Relative names are resolved after changing to cwd.
    const char *stdoutFile = nullptr;

    // If set, the child's stdout is collected here instead.
    std::string *captureStdout = nullptr;
};

enum {
    // Exit status of a child whose program could not be executed.
    EXIT_EXEC_FAILED = 127,
    // A child killed by signal N reports EXIT_SIGNAL_BASE + N.
    EXIT_SIGNAL_BASE = 128,
};

/** Run argv[0] (searched in PATH) with the given arguments and wait for
    it.  Returns the child's exit status.  stderr is always inherited.

    Throws build_exception if the child cannot be started at all. **/
int runProcess(const std::vector<std::string> &argv, const ProcessOptions &opts = ProcessOptions());

/** Join argv into a single line for display. **/
std::string commandLine(const std::vector<std::string> &argv);

#endif
