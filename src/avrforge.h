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
 * Global declarations: diagnostic output and the exception hierarchy.
 */

#ifndef AVRFORGE_H
#define AVRFORGE_H

#include <cstdarg>
#include <cstddef>
#include <exception>
#include <string>
#include <utility>

#ifndef PACKAGE_VERSION
#  define PACKAGE_VERSION "unknown"
#endif

extern bool debugMode;

void vdebugOut(const char *fmt, va_list args);
void debugOut(const char *fmt, ...);
void vstatusOut(const char *fmt, va_list args);
void statusOut(const char *fmt, ...);
void statusFlush();

/** Exit status used for configuration, precondition and usage errors. */
constexpr int EXIT_BUILD_ERROR = 1;

class build_exception : public std::exception {
  protected:
    std::string reason;
    int status;

  public:
    build_exception() : reason("build failed"), status(EXIT_BUILD_ERROR) {}
    explicit build_exception(std::string r, int st = EXIT_BUILD_ERROR)
        : reason(std::move(r)), status(st) {}

    const char *what() const noexcept override { return reason.c_str(); }

    /** Value main() returns when this exception ends the run. */
    int exitStatus() const { return status; }
};

/** An external tool ran but returned a non-zero status. */
class tool_exception : public build_exception {
    std::string tool;

  public:
    tool_exception(const std::string &toolName, int st);

    const std::string &toolName() const { return tool; }
};

/** A step was asked to consume an artifact that does not exist. */
class precondition_exception : public build_exception {
  public:
    explicit precondition_exception(const std::string &r) : build_exception(r) {}
};

class config_exception : public build_exception {
  public:
    explicit config_exception(const std::string &r) : build_exception(r) {}
};

#endif
