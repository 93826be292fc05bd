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
 * Command line parsing for avrforge.
 */

#ifndef CMDLINE_H
#define CMDLINE_H

#include "builder.h"
#include "config.h"

/** What main() should do once the command line has been read. */
enum class CliAction {
    RUN,          // run cmd
    HELP,         // -h, "help" or no command at all
    VERSION,      // -V
    LIST_DEVICES, // -k
    BAD_OPTION,   // unknown option or missing argument, already reported
};

/** Read the environment, then the options, then the NAME=VALUE arguments
    into cfg, and pick the single command.  Later sources override earlier
    ones, so a NAME=VALUE argument beats an option for the same value.

    Throws config_exception for unknown variables or commands, invalid
    values and for more than one command. **/
CliAction parseCommandLine(int argc, char **argv, BuildConfig &cfg, Command &cmd);

#endif
