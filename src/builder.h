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
 * The build orchestrator: user commands as fixed sequences of steps.
 */

#ifndef BUILDER_H
#define BUILDER_H

#include <string_view>
#include <vector>

#include "config.h"
#include "programmer.h"
#include "toolchain.h"

enum class Command { HELP, ALL, ELF, BIN, HEX, ASM, INSTALL, UPLOAD, FUSES, CLEAN };

enum class Step {
    BUILD_ELF,
    BUILD_BIN,
    BUILD_HEX,
    BUILD_ASM,
    REMOVE_TEMP,
    SIZE,
    REMOVE_ELF,
    PROGRAM_ALL,   // fuses and flash
    PROGRAM_FLASH,
    PROGRAM_FUSES,
    CLEAN,
};

/** Throws config_exception for names that are not a command. */
Command parseCommand(std::string_view name);

const char *commandName(Command cmd);

/** The steps cmd runs, in order.  Empty for HELP. */
std::vector<Step> pipelineFor(Command cmd);

class Builder {
    const BuildConfig &cfg;
    Toolchain &toolchain;
    Programmer &programmer;

    std::string path(const std::string &name) const { return cfg.inWorkDir(name); }
    void requireArtifact(const char *ext) const;

  public:
    Builder(const BuildConfig &cfg, Toolchain &toolchain, Programmer &programmer);

    /** Run every step of cmd.  The first failing step throws and the
        rest are skipped. **/
    void run(Command cmd);

    void runStep(Step step);

    // Primitive steps
    // ---------------

    void buildElf();
    void buildImage(ImageFormat format);
    void buildAsm();

    /** Print flash and RAM usage of the ELF and return the totals. */
    SectionSizes reportSize();

    void removeTemp();
    void removeElf();

    /** Remove intermediates and all final artifacts.  Idempotent. */
    void clean();

    /** One programmer session; flash and/or fuses from the configuration. */
    void program(bool withFuses, bool withFlash);
};

#endif
