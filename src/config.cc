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
 * This file parses configuration values from the environment and the
 * command line.
 */

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "avrforge.h"
#include "config.h"

static const unsigned int fuseIndices[] = {0, 1, 2, 4, 5, 6, 7, 8};

bool isValidFuseIndex(unsigned int index) {
    for (unsigned int i : fuseIndices)
        if (i == index)
            return true;
    return false;
}

unsigned long parseClock(std::string_view val) {
    const std::string s(val);
    char *endptr;

    if (s.empty() || !isdigit((unsigned char)s[0]))
        throw config_exception("invalid clock frequency '" + s + "'");

    errno = 0;
    unsigned long v = strtoul(s.c_str(), &endptr, 10);
    if (errno == ERANGE)
        throw config_exception("clock frequency out of range '" + s + "'");

    while (isspace((unsigned char)*endptr))
        endptr++;

    unsigned long mult = 1;
    switch (*endptr) {
    case 'k':
    case 'K':
        mult = 1000UL;
        endptr++;
        break;
    case 'm':
    case 'M':
        mult = 1000000UL;
        endptr++;
        break;
    }
    if (*endptr != '\0' && strcmp(endptr, "Hz") != 0 && strcmp(endptr, "hz") != 0)
        throw config_exception("invalid clock frequency '" + s + "'");

    if (v > MAX_CLOCK / mult)
        throw config_exception("clock frequency out of range '" + s + "'");
    v *= mult;
    if (v == 0)
        throw config_exception("clock frequency must not be zero");

    return v;
}

unsigned char parseFuseByte(std::string_view val) {
    const std::string s(val);
    char *endptr;
    unsigned long v;

    if (s.empty())
        throw config_exception("empty fuse value");

    errno = 0;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'b' || s[1] == 'B'))
        v = strtoul(s.c_str() + 2, &endptr, 2);
    else
        v = strtoul(s.c_str(), &endptr, 0);

    if (*endptr != '\0' || errno == ERANGE || !isdigit((unsigned char)s[0]))
        throw config_exception("invalid fuse value '" + s + "'");
    if (v > 0xFF)
        throw config_exception("fuse value '" + s + "' does not fit in a byte");

    return (unsigned char)v;
}

SizeBackend parseSizeBackend(std::string_view val) {
    if (val == "avr-size")
        return SizeBackend::AVR_SIZE;
    if (val == "bfd")
        return SizeBackend::BFD;
    throw config_exception("unknown size backend '" + std::string(val) +
                           "' (use avr-size or bfd)");
}

std::string formatFuse(unsigned int index, unsigned char value) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%u:0x%02X", index, value);
    return buf;
}

std::string formatFuses(const FuseMap &fuses) {
    std::string out;

    for (const auto &f : fuses) {
        if (!out.empty())
            out += ' ';
        out += formatFuse(f.first, f.second);
    }
    return out;
}

std::string BuildConfig::inWorkDir(const std::string &name) const {
    if (name.empty() || name[0] == '/' || workDir.empty() || workDir == ".")
        return name;
    if (workDir.back() == '/')
        return workDir + name;
    return workDir + "/" + name;
}

void BuildConfig::setFuse(std::string_view arg) {
    const auto colon = arg.find(':');
    if (colon == std::string_view::npos || colon == 0)
        throw config_exception("fuse must be given as index:value, not '" +
                               std::string(arg) + "'");

    const std::string idx(arg.substr(0, colon));
    char *endptr;
    const unsigned long index = strtoul(idx.c_str(), &endptr, 10);
    if (*endptr != '\0' || idx.empty() || index > 8 || !isValidFuseIndex(index))
        throw config_exception("invalid fuse index '" + idx + "'");

    fuses[index] = parseFuseByte(arg.substr(colon + 1));
}

bool BuildConfig::assign(std::string_view name, std::string_view value) {
    if (name == "SKETCH" || name == "TARGET" || name == "DEVICE") {
        if (value.empty())
            throw config_exception(std::string(name) + " must not be empty");
    }

    if (name == "SKETCH")
        sketch = value;
    else if (name == "TARGET")
        target = value;
    else if (name == "DEVICE")
        device = value;
    else if (name == "CLOCK")
        clock = parseClock(value);
    else if (name == "GCCPATH")
        gccPath = value;
    else if (name == "DFPPATH")
        dfpPath = value;
    else if (name == "PYMPATH")
        pymPath = value;
    else if (name == "PYTHON")
        python = value;
    else if (name.size() == 5 && name.substr(0, 4) == "FUSE" && isdigit((unsigned char)name[4])) {
        const unsigned int index = name[4] - '0';
        if (!isValidFuseIndex(index))
            return false;
        fuses[index] = parseFuseByte(value);
    } else
        return false;

    debugOut("Config: %.*s = %.*s\n", (int)name.size(), name.data(),
             (int)value.size(), value.data());
    return true;
}

void BuildConfig::loadEnvironment() {
    static const char *const names[] = {
        "SKETCH", "TARGET", "DEVICE", "CLOCK", "GCCPATH", "DFPPATH", "PYMPATH", "PYTHON",
    };

    for (const char *name : names) {
        const char *cp = getenv(name);
        if (cp != nullptr)
            assign(name, cp);
    }
    for (unsigned int i : fuseIndices) {
        const std::string name = "FUSE" + std::to_string(i);
        const char *cp = getenv(name.c_str());
        if (cp != nullptr)
            assign(name, cp);
    }
}
