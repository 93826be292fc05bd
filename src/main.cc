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
 * This file contains the main() & command line handling for avrforge.
 */

#include <cstdio>

#include "avrforge.h"
#include "builder.h"
#include "cmdline.h"
#include "config.h"
#include "devices.h"
#include "programmer.h"
#include "toolchain.h"

static void usage(const char *progname, const BuildConfig &cfg) {
    fprintf(stderr, "Usage: %s [OPTION]... [NAME=VALUE]... [COMMAND]\n\n", progname);
    fprintf(stderr, "Commands:\n");
    fprintf(stderr,
            "  all       compile and build %s.elf/.hex/.bin/.asm for %s\n"
            "  elf       compile and build %s.elf for %s\n"
            "  hex       compile and build %s.hex for %s\n"
            "  bin       compile and build %s.bin for %s\n"
            "  asm       compile and disassemble to %s.asm for %s\n"
            "  upload    compile and upload to %s\n"
            "  fuses     burn fuses of %s\n"
            "  install   compile, upload and burn fuses for %s\n"
            "  clean     remove all build files\n"
            "  help      print this message (default)\n\n",
            cfg.target.c_str(), cfg.device.c_str(), cfg.target.c_str(), cfg.device.c_str(),
            cfg.target.c_str(), cfg.device.c_str(), cfg.target.c_str(), cfg.device.c_str(),
            cfg.target.c_str(), cfg.device.c_str(), cfg.device.c_str(), cfg.device.c_str(),
            cfg.device.c_str());
    fprintf(stderr, "Options:\n");
    fprintf(stderr,
            "  -h, --help                  Print this message.\n");
    fprintf(stderr,
            "  -C, --directory <dir>       Build in <dir> (default: current directory).\n");
    fprintf(stderr,
            "  -d, --debug                 Enable printing of debug information.\n");
    fprintf(stderr,
            "  -D, --dfp-path <dir>        Device family pack (default: %s).\n",
            cfg.dfpPath.c_str());
    fprintf(stderr,
            "  -F, --clock <freq>          CPU clock, e.g. 16000000, 20M, 8 MHz\n"
            "                                (default: %lu).\n",
            cfg.clock);
    fprintf(stderr,
            "  -f, --fuse <n:value>        Set fuse byte n (0,1,2,4,5,6,7,8), may be\n"
            "                                repeated.\n");
    fprintf(stderr,
            "  -g, --gcc-path <dir>        AVR toolchain root (default: %s).\n",
            cfg.gccPath.c_str());
    fprintf(stderr,
            "  -k, --known-devices         Print a list of known devices.\n");
    fprintf(stderr,
            "  -P, --part <name>           Target device name (default: %s).\n",
            cfg.device.c_str());
    fprintf(stderr,
            "  -S, --size-backend <name>   avr-size (default) or bfd.\n");
    fprintf(stderr,
            "  -s, --sketch <file>         Source file (default: %s).\n",
            cfg.sketch.c_str());
    fprintf(stderr,
            "  -t, --target <name>         Artifact base name (default: %s).\n",
            cfg.target.c_str());
    fprintf(stderr,
            "  -u, --updi-path <dir>       Directory holding tinyupdi.py (default: %s).\n",
            cfg.pymPath.c_str());
    fprintf(stderr,
            "  -V, --version               Print version information.\n");
    fprintf(stderr,
            "  -y, --python <prog>         Python interpreter (default: %s).\n\n",
            cfg.python.c_str());
    fprintf(stderr,
            "SKETCH, TARGET, DEVICE, CLOCK, FUSE0 .. FUSE8, GCCPATH, DFPPATH, PYMPATH\n"
            "and PYTHON are also taken from the environment or from NAME=VALUE\n"
            "arguments; options and arguments override the environment.\n\n");
    fprintf(stderr, "Example usage:\n");
    fprintf(stderr, "\t%s install\n", progname);
    fprintf(stderr, "\t%s DEVICE=attiny1614 -f 5:0xC4 upload\n", progname);
    fprintf(stderr, "\n");
}

int main(int argc, char **argv) {
    const char *progname = argv[0];
    BuildConfig cfg;
    Command cmd = Command::HELP;

    try {
        switch (parseCommandLine(argc, argv, cfg, cmd)) {
        case CliAction::HELP:
            usage(progname, cfg);
            return 0;
        case CliAction::BAD_OPTION:
            usage(progname, cfg);
            return EXIT_BUILD_ERROR;
        case CliAction::LIST_DEVICES:
            fprintf(stderr, "List of known AVR devices:\n\n");
            avr_device_def::DumpAll();
            return 0;
        case CliAction::VERSION:
            statusOut("avrforge version %s\n", PACKAGE_VERSION);
            return 0;
        case CliAction::RUN:
            break;
        }

        if (debugMode)
            setvbuf(stderr, NULL, _IOLBF, 0);

        if (cmd != Command::CLEAN && avr_device_def::Find(cfg.device) == nullptr)
            statusOut("WARNING: %s is not in the internal device list; "
                      "sizes are not checked against it\n", cfg.device.c_str());

        AvrGccToolchain toolchain;
        TinyUpdiProgrammer programmer;
        Builder builder(cfg, toolchain, programmer);

        builder.run(cmd);
    } catch (build_exception &e) {
        statusFlush();
        fprintf(stderr, "%s: %s\n", progname, e.what());
        return e.exitStatus();
    }

    return 0;
}
