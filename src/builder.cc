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
 * This file sequences the toolchain and programmer for each command.
 */

#include <cstdio>

#include "artifacts.h"
#include "avrforge.h"
#include "builder.h"
#include "devices.h"

static const struct {
    const char *name;
    Command cmd;
} commandNames[] = {
    {"help", Command::HELP},       {"all", Command::ALL},       {"elf", Command::ELF},
    {"bin", Command::BIN},         {"hex", Command::HEX},       {"asm", Command::ASM},
    {"install", Command::INSTALL}, {"upload", Command::UPLOAD}, {"fuses", Command::FUSES},
    {"clean", Command::CLEAN},
};

Command parseCommand(std::string_view name) {
    for (const auto &c : commandNames)
        if (name == c.name)
            return c.cmd;
    throw config_exception("unknown command '" + std::string(name) + "'");
}

const char *commandName(Command cmd) {
    for (const auto &c : commandNames)
        if (cmd == c.cmd)
            return c.name;
    return "?";
}

std::vector<Step> pipelineFor(Command cmd) {
    switch (cmd) {
    case Command::HELP:
        return {};
    case Command::ALL:
        return {Step::BUILD_ELF, Step::BUILD_BIN,   Step::BUILD_HEX,
                Step::BUILD_ASM, Step::REMOVE_TEMP, Step::SIZE};
    case Command::ELF:
        return {Step::BUILD_ELF, Step::REMOVE_TEMP, Step::SIZE};
    case Command::BIN:
        return {Step::BUILD_ELF, Step::BUILD_BIN, Step::REMOVE_TEMP, Step::SIZE, Step::REMOVE_ELF};
    case Command::HEX:
        return {Step::BUILD_ELF, Step::BUILD_HEX, Step::REMOVE_TEMP, Step::SIZE, Step::REMOVE_ELF};
    case Command::ASM:
        return {Step::BUILD_ELF, Step::BUILD_ASM, Step::REMOVE_TEMP, Step::SIZE, Step::REMOVE_ELF};
    case Command::INSTALL: {
        auto steps = pipelineFor(Command::BIN);
        steps.push_back(Step::PROGRAM_ALL);
        return steps;
    }
    case Command::UPLOAD: {
        auto steps = pipelineFor(Command::BIN);
        steps.push_back(Step::PROGRAM_FLASH);
        return steps;
    }
    case Command::FUSES:
        return {Step::PROGRAM_FUSES};
    case Command::CLEAN:
        return {Step::CLEAN};
    }
    return {};
}

Builder::Builder(const BuildConfig &cfg, Toolchain &toolchain, Programmer &programmer)
    : cfg(cfg), toolchain(toolchain), programmer(programmer) {}

void Builder::run(Command cmd) {
    debugOut("Running '%s'\n", commandName(cmd));
    for (Step step : pipelineFor(cmd))
        runStep(step);
}

void Builder::runStep(Step step) {
    switch (step) {
    case Step::BUILD_ELF:
        buildElf();
        break;
    case Step::BUILD_BIN:
        buildImage(ImageFormat::BINARY);
        break;
    case Step::BUILD_HEX:
        buildImage(ImageFormat::IHEX);
        break;
    case Step::BUILD_ASM:
        buildAsm();
        break;
    case Step::REMOVE_TEMP:
        removeTemp();
        break;
    case Step::SIZE:
        reportSize();
        break;
    case Step::REMOVE_ELF:
        removeElf();
        break;
    case Step::PROGRAM_ALL:
        statusOut("Installing to %s ...\n", cfg.device.c_str());
        program(true, true);
        break;
    case Step::PROGRAM_FLASH:
        statusOut("Uploading to %s ...\n", cfg.device.c_str());
        program(false, true);
        break;
    case Step::PROGRAM_FUSES:
        statusOut("Burning fuses of %s ...\n", cfg.device.c_str());
        program(true, false);
        break;
    case Step::CLEAN:
        clean();
        break;
    }
}

void Builder::requireArtifact(const char *ext) const {
    const std::string name = cfg.artifact(ext);
    if (!artifactExists(path(name)))
        throw precondition_exception(name + " not found; it has to be built first");
}

void Builder::buildElf() {
    const std::string elf = cfg.artifact("elf");
    statusOut("Building %s for %s @ %luHz ...\n", elf.c_str(), cfg.device.c_str(), cfg.clock);
    toolchain.compile(cfg, elf);
}

void Builder::buildImage(ImageFormat format) {
    const std::string out = cfg.artifact(format == ImageFormat::IHEX ? "hex" : "bin");
    statusOut("Building %s ...\n", out.c_str());
    requireArtifact("elf");
    toolchain.extract(cfg, cfg.artifact("elf"), format, out);
}

void Builder::buildAsm() {
    const std::string out = cfg.artifact("asm");
    statusOut("Disassembling to %s ...\n", out.c_str());
    requireArtifact("elf");
    toolchain.disassemble(cfg, cfg.artifact("elf"), out);
}

SectionSizes Builder::reportSize() {
    requireArtifact("elf");
    const SectionSizes s = toolchain.measure(cfg, cfg.artifact("elf"));

    const avr_device_def *dev = avr_device_def::Find(cfg.device);
    if (dev != nullptr) {
        statusOut("FLASH: %lu bytes (%.1f%% of %u)\n", s.flash(),
                  100.0 * s.flash() / dev->flash_size, dev->flash_size);
        statusOut("SRAM:  %lu bytes (%.1f%% of %u)\n", s.ram(), 100.0 * s.ram() / dev->sram_size,
                  dev->sram_size);
        if (s.flash() > dev->flash_size || s.ram() > dev->sram_size)
            statusOut("WARNING: program does not fit into %s\n", dev->name);
    } else {
        statusOut("FLASH: %lu bytes\n", s.flash());
        statusOut("SRAM:  %lu bytes\n", s.ram());
    }
    return s;
}

void Builder::removeTemp() {
    statusOut("Removing temporary files ...\n");
    for (const char *const *p = intermediatePatterns; *p != nullptr; p++)
        removeMatching(cfg.workDir, *p);
}

void Builder::removeElf() {
    const std::string elf = cfg.artifact("elf");
    statusOut("Removing %s ...\n", elf.c_str());
    removeArtifact(path(elf));
}

void Builder::clean() {
    statusOut("Cleaning all up ...\n");
    for (const char *const *p = intermediatePatterns; *p != nullptr; p++)
        removeMatching(cfg.workDir, *p);
    for (const char *const *p = artifactExtensions; *p != nullptr; p++)
        removeArtifact(path(cfg.artifact(*p)));
}

void Builder::program(bool withFuses, bool withFlash) {
    ProgramRequest req;

    if (withFuses) {
        debugOut("Fuses: %s\n", formatFuses(cfg.fuses).c_str());
        req.fuses = cfg.fuses;
    }
    if (withFlash) {
        requireArtifact("bin");
        req.flash = cfg.artifact("bin");
    }
    programmer.program(cfg, req);
}
