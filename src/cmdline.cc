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
 * This file turns argv and the environment into a BuildConfig.
 */

#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <string>

#include "avrforge.h"
#include "cmdline.h"

static struct option long_opts[] = {
    /* name,                 has_arg, flag,   val */
    { "directory",           1,       0,     'C' },
    { "debug",               0,       0,     'd' },
    { "dfp-path",            1,       0,     'D' },
    { "clock",               1,       0,     'F' },
    { "fuse",                1,       0,     'f' },
    { "gcc-path",            1,       0,     'g' },
    { "help",                0,       0,     'h' },
    { "known-devices",       0,       0,     'k' },
    { "part",                1,       0,     'P' },
    { "size-backend",        1,       0,     'S' },
    { "sketch",              1,       0,     's' },
    { "target",              1,       0,     't' },
    { "updi-path",           1,       0,     'u' },
    { "version",             0,       0,     'V' },
    { "python",              1,       0,     'y' },
    { 0,                     0,       0,      0 }
};

CliAction parseCommandLine(int argc, char **argv, BuildConfig &cfg, Command &cmd) {
    bool haveCommand = false;
    int option_index;

    cmd = Command::HELP;

    optind = 0; /* start over, main() is not the only caller */
    opterr = 0; /* disable default error message */

    // Environment first, so that options can override it.
    cfg.loadEnvironment();

    while (1) {
        int c = getopt_long(argc, argv, "C:dD:F:f:g:hkP:S:s:t:u:Vy:", long_opts, &option_index);
        if (c == -1)
            break; /* no more options */

        switch (c) {
        case 'h':
            return CliAction::HELP;
        case '?':
            if (optopt)
                fprintf(stderr, "%s: invalid option or missing argument -- '%c'\n\n", argv[0],
                        optopt);
            else
                fprintf(stderr, "%s: invalid option -- '%s'\n\n", argv[0], argv[optind - 1]);
            return CliAction::BAD_OPTION;
        case 'k':
            return CliAction::LIST_DEVICES;
        case 'V':
            return CliAction::VERSION;
        case 'C':
            cfg.workDir = optarg;
            break;
        case 'd':
            debugMode = true;
            break;
        case 'D':
            cfg.dfpPath = optarg;
            break;
        case 'F':
            cfg.clock = parseClock(optarg);
            break;
        case 'f':
            cfg.setFuse(optarg);
            break;
        case 'g':
            cfg.gccPath = optarg;
            break;
        case 'P':
            cfg.assign("DEVICE", optarg);
            break;
        case 'S':
            cfg.sizeBackend = parseSizeBackend(optarg);
            break;
        case 's':
            cfg.assign("SKETCH", optarg);
            break;
        case 't':
            cfg.assign("TARGET", optarg);
            break;
        case 'u':
            cfg.pymPath = optarg;
            break;
        case 'y':
            cfg.python = optarg;
            break;
        default:
            fprintf(stderr, "getopt() did something screwey");
            return CliAction::BAD_OPTION;
        }
    }

    // getopt_long has moved the operands behind the options.
    for (int i = optind; i < argc; i++) {
        const char *arg = argv[i];
        const char *eq = strchr(arg, '=');

        if (eq != nullptr && eq != arg) {
            const std::string_view name(arg, eq - arg);
            if (!cfg.assign(name, eq + 1))
                throw config_exception("unknown variable '" + std::string(name) + "'");
        } else if (!haveCommand) {
            cmd = parseCommand(arg);
            haveCommand = true;
        } else {
            throw config_exception("only one command may be given");
        }
    }

    return cmd == Command::HELP ? CliAction::HELP : CliAction::RUN;
}
