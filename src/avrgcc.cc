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
 * This file implements the Toolchain interface on top of avr-gcc and
 * the AVR flavour of GNU binutils.
 */

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sys/stat.h>

#include "avrforge.h"
#include "elfimage.h"
#include "process.h"
#include "toolchain.h"

SectionSizes parseSizeOutput(std::string_view output) {
    size_t pos = 0;

    while (pos < output.size()) {
        size_t eol = output.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = output.size();
        const std::string line(output.substr(pos, eol - pos));
        pos = eol + 1;

        bool hasDigit = false;
        for (char c : line)
            if (isdigit((unsigned char)c))
                hasDigit = true;
        if (!hasDigit)
            continue;

        unsigned long col[3];
        const char *cp = line.c_str();
        for (unsigned long &v : col) {
            char *endptr;
            while (isspace((unsigned char)*cp))
                cp++;
            if (!isdigit((unsigned char)*cp))
                throw build_exception("unexpected size output: '" + line + "'");
            errno = 0;
            v = strtoul(cp, &endptr, 10);
            if (errno == ERANGE || (*endptr != '\0' && !isspace((unsigned char)*endptr)))
                throw build_exception("unexpected size output: '" + line + "'");
            cp = endptr;
        }

        SectionSizes s;
        s.text = col[0];
        s.data = col[1];
        s.bss = col[2];
        return s;
    }

    throw build_exception("size output contains no section totals");
}

std::string AvrGccToolchain::tool(const BuildConfig &cfg, const char *name) {
    return cfg.gccPath + "/bin/" + name;
}

void AvrGccToolchain::run(const BuildConfig &cfg, const std::vector<std::string> &argv,
                          const char *stdoutFile, std::string *capture) {
    ProcessOptions opts;
    opts.cwd = cfg.workDir.c_str();
    opts.stdoutFile = stdoutFile;
    opts.captureStdout = capture;

    const int status = runProcess(argv, opts);
    if (status != 0) {
        const std::string &prog = argv[0];
        const size_t slash = prog.rfind('/');
        throw tool_exception(slash == std::string::npos ? prog : prog.substr(slash + 1), status);
    }
}

std::vector<std::string> AvrGccToolchain::compileCommand(const BuildConfig &cfg,
                                                         const std::string &elf) {
    return {
        tool(cfg, "avr-gcc"),
        "-B", cfg.dfpPath + "/gcc/dev/" + cfg.device + "/",
        "-I", cfg.dfpPath + "/include/",
        "-flto", "-Wall", "-Os",
        "-mmcu=" + cfg.device,
        "-DF_CPU=" + std::to_string(cfg.clock) + "UL",
        "-x", "c++", cfg.sketch,
        "-o", elf,
    };
}

std::vector<std::string> AvrGccToolchain::objcopyCommand(const BuildConfig &cfg,
                                                         const std::string &elf,
                                                         ImageFormat format,
                                                         const std::string &out) {
    return {
        tool(cfg, "avr-objcopy"),
        "-O", format == ImageFormat::IHEX ? "ihex" : "binary",
        "-R", ".eeprom",
        elf, out,
    };
}

std::vector<std::string> AvrGccToolchain::objdumpCommand(const BuildConfig &cfg,
                                                         const std::string &elf) {
    return {tool(cfg, "avr-objdump"), "-d", elf};
}

std::vector<std::string> AvrGccToolchain::sizeCommand(const BuildConfig &cfg,
                                                      const std::string &elf) {
    return {tool(cfg, "avr-size"), "-d", elf};
}

void AvrGccToolchain::compile(const BuildConfig &cfg, const std::string &elf) {
    // Without the pack avr-gcc fails with a less helpful message about
    // missing specs or crt files.
    const std::string devdir = cfg.inWorkDir(cfg.dfpPath + "/gcc/dev/" + cfg.device);
    struct stat st;
    if (stat(devdir.c_str(), &st) < 0 || !S_ISDIR(st.st_mode))
        throw config_exception("device family pack has no support for " + cfg.device + " (" +
                               devdir + " missing)");

    run(cfg, compileCommand(cfg, elf));
}

void AvrGccToolchain::extract(const BuildConfig &cfg, const std::string &elf, ImageFormat format,
                              const std::string &out) {
    run(cfg, objcopyCommand(cfg, elf, format, out));
}

void AvrGccToolchain::disassemble(const BuildConfig &cfg, const std::string &elf,
                                  const std::string &out) {
    run(cfg, objdumpCommand(cfg, elf), out.c_str());
}

SectionSizes AvrGccToolchain::measure(const BuildConfig &cfg, const std::string &elf) {
    if (cfg.sizeBackend == SizeBackend::BFD) {
        ElfImage image(cfg.inWorkDir(elf));
        image.dumpSections();
        return image.sizes();
    }

    std::string output;
    run(cfg, sizeCommand(cfg, elf), nullptr, &output);
    debugOut("avr-size said:\n%s", output.c_str());
    return parseSizeOutput(output);
}
