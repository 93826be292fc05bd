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
 * Build configuration: the values a single invocation works with.
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <map>
#include <string>
#include <string_view>

/** Fuse index -> fuse byte.  Iterates in index order. */
typedef std::map<unsigned int, unsigned char> FuseMap;

enum class SizeBackend { AVR_SIZE, BFD };

struct BuildConfig {
    // Input and output file names
    std::string sketch = "DumpMaster64.ino";
    std::string target = "dumpmaster64";

    // Microcontroller options
    std::string device = "attiny814";
    unsigned long clock = 16000000UL;
    FuseMap fuses = {{0, 0x00}, {1, 0x00}, {2, 0x01}, {4, 0x00},
                     {5, 0xC5}, {6, 0x04}, {7, 0x00}, {8, 0x00}};

    // Paths, relative ones are taken from workDir
    std::string gccPath = "./tools/avr-gcc";
    std::string dfpPath = "./tools/dfp";
    std::string pymPath = "./tools/tinyupdi";
    std::string python = "python";
    std::string workDir = ".";

    SizeBackend sizeBackend = SizeBackend::AVR_SIZE;

    /** Name of a final artifact, e.g. artifact("elf") -> "dumpmaster64.elf". */
    std::string artifact(const char *ext) const { return target + "." + ext; }

    /** Path of a file named relative to workDir. */
    std::string inWorkDir(const std::string &name) const;

    /** Apply one NAME=VALUE setting.  Returns false for unknown names. */
    bool assign(std::string_view name, std::string_view value);

    /** Apply every recognised variable found in the environment. */
    void loadEnvironment();

    /** Apply a "-f" style "index:value" fuse setting. */
    void setFuse(std::string_view arg);
};

/** Highest clock parseClock() accepts; F_CPU must fit in 32 bits. */
constexpr unsigned long MAX_CLOCK = 0xFFFFFFFFUL;

/** Clock frequency, "16000000", "16M", "20 MHz", "32768Hz" ... */
unsigned long parseClock(std::string_view val);

/** A fuse byte, decimal, 0x hex, 0b binary or leading-0 octal. */
unsigned char parseFuseByte(std::string_view val);

/** Fuse indices the tinyAVR fuse map has; fuse 3 is reserved. */
bool isValidFuseIndex(unsigned int index);

SizeBackend parseSizeBackend(std::string_view val);

/** One "index:0xNN" fuse setting, e.g. "5:0xC5". */
std::string formatFuse(unsigned int index, unsigned char value);

/** "0:0x00 1:0x00 2:0x01 ..." as the programmer expects it. */
std::string formatFuses(const FuseMap &fuses);

#endif
