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
 * Interface to the cross toolchain that turns a sketch into images.
 */

#ifndef TOOLCHAIN_H
#define TOOLCHAIN_H

#include <string>
#include <string_view>
#include <vector>

#include "config.h"

enum class ImageFormat { BINARY, IHEX };

/** Berkeley style section totals, as printed by "avr-size -d". */
struct SectionSizes {
    unsigned long text = 0;
    unsigned long data = 0;
    unsigned long bss = 0;

    /** Bytes occupied in program memory: code plus initialised data. */
    unsigned long flash() const { return text + data; }

    /** Bytes of SRAM allocated statically. */
    unsigned long ram() const { return data + bss; }
};

/** Parse the output of "avr-size -d": the first line containing a digit
    supplies text, data and bss in its first three columns. */
SectionSizes parseSizeOutput(std::string_view output);

class Toolchain {
  public:
    virtual ~Toolchain() = default;

    /** Compile cfg.sketch into the ELF file named elf (relative to cfg.workDir). */
    virtual void compile(const BuildConfig &cfg, const std::string &elf) = 0;

    /** Copy the loadable sections of elf, minus .eeprom, into out. */
    virtual void extract(const BuildConfig &cfg, const std::string &elf, ImageFormat format,
                         const std::string &out) = 0;

    /** Write a disassembly listing of elf to out. */
    virtual void disassemble(const BuildConfig &cfg, const std::string &elf,
                             const std::string &out) = 0;

    /** Section totals of elf. */
    virtual SectionSizes measure(const BuildConfig &cfg, const std::string &elf) = 0;
};

/** The avr-gcc / GNU binutils toolchain found below cfg.gccPath. */
class AvrGccToolchain : public Toolchain {
  public:
    void compile(const BuildConfig &cfg, const std::string &elf) override;
    void extract(const BuildConfig &cfg, const std::string &elf, ImageFormat format,
                 const std::string &out) override;
    void disassemble(const BuildConfig &cfg, const std::string &elf,
                     const std::string &out) override;
    SectionSizes measure(const BuildConfig &cfg, const std::string &elf) override;

    // The command lines, exposed so they can be checked without a toolchain.
    static std::vector<std::string> compileCommand(const BuildConfig &cfg, const std::string &elf);
    static std::vector<std::string> objcopyCommand(const BuildConfig &cfg, const std::string &elf,
                                                   ImageFormat format, const std::string &out);
    static std::vector<std::string> objdumpCommand(const BuildConfig &cfg, const std::string &elf);
    static std::vector<std::string> sizeCommand(const BuildConfig &cfg, const std::string &elf);

  private:
    static std::string tool(const BuildConfig &cfg, const char *name);
    static void run(const BuildConfig &cfg, const std::vector<std::string> &argv,
                    const char *stdoutFile = nullptr, std::string *capture = nullptr);
};

#endif
