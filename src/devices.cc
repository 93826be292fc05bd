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
 * This file contains the memory layout of the tinyAVR 0-, 1- and
 * 2-series parts, taken from the datasheets.
 */

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

#include "avrforge.h"
#include "devices.h"

namespace {

constexpr avr_device_def deviceDefinitions[] = {
    // name          flash   sram  eeprom
    {"attiny202",     2048,   128,   64},
    {"attiny204",     2048,   128,   64},
    {"attiny212",     2048,   128,   64},
    {"attiny214",     2048,   128,   64},
    {"attiny402",     4096,   256,  128},
    {"attiny404",     4096,   256,  128},
    {"attiny406",     4096,   256,  128},
    {"attiny412",     4096,   256,  128},
    {"attiny414",     4096,   256,  128},
    {"attiny416",     4096,   256,  128},
    {"attiny417",     4096,   256,  128},
    {"attiny424",     4096,   512,  128},
    {"attiny426",     4096,   512,  128},
    {"attiny427",     4096,   512,  128},
    {"attiny804",     8192,   512,  128},
    {"attiny806",     8192,   512,  128},
    {"attiny807",     8192,   512,  128},
    {"attiny814",     8192,   512,  128},
    {"attiny816",     8192,   512,  128},
    {"attiny817",     8192,   512,  128},
    {"attiny824",     8192,  1024,  128},
    {"attiny826",     8192,  1024,  128},
    {"attiny827",     8192,  1024,  128},
    {"attiny1604",   16384,  1024,  256},
    {"attiny1606",   16384,  1024,  256},
    {"attiny1607",   16384,  1024,  256},
    {"attiny1614",   16384,  2048,  256},
    {"attiny1616",   16384,  2048,  256},
    {"attiny1617",   16384,  2048,  256},
    {"attiny1624",   16384,  2048,  256},
    {"attiny1626",   16384,  2048,  256},
    {"attiny1627",   16384,  2048,  256},
    {"attiny3216",   32768,  2048,  256},
    {"attiny3217",   32768,  2048,  256},
    {"attiny3224",   32768,  3072,  256},
    {"attiny3226",   32768,  3072,  256},
    {"attiny3227",   32768,  3072,  256},
};

} // namespace

const avr_device_def *avr_device_def::Find(std::string_view name) {

    // So we can do a case insensitive search in our database
    std::string lowercase_name(name);
    std::transform(lowercase_name.begin(), lowercase_name.end(), lowercase_name.begin(),
                   [](unsigned char c) { return (char)tolower(c); });

    debugOut("Looking for device: %s\n", lowercase_name.c_str());
    for (const auto &dev : deviceDefinitions)
        if (lowercase_name == dev.name)
            return &dev;

    return nullptr;
}

void avr_device_def::DumpAll() {
    fprintf(stderr, "%-15s  %8s  %8s  %8s\n", "Device Name", "Flash", "SRAM", "EEPROM");
    fprintf(stderr, "%-15s  %8s  %8s  %8s\n", "---------------", "-------", "-------",
            "-------");
    for (const auto &dev : deviceDefinitions) {
        fprintf(stderr, "%-15s  %4u KiB  %4u B    %4u B\n", dev.name, dev.flash_size / 1024,
                dev.sram_size, dev.eeprom_size);
    }
}
