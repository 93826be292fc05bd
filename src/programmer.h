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
 * Interface to the device programmer.
 */

#ifndef PROGRAMMER_H
#define PROGRAMMER_H

#include <optional>
#include <string>
#include <vector>

#include "config.h"

/** What one programming session writes.  At least one of the two is set. */
struct ProgramRequest {
    std::optional<FuseMap> fuses;
    std::optional<std::string> flash; // image file, relative to cfg.workDir
};

class Programmer {
  public:
    virtual ~Programmer() = default;

    /** Write the request to the target in a single session. */
    virtual void program(const BuildConfig &cfg, const ProgramRequest &req) = 0;
};

/** tinyupdi.py, talking UPDI through a USB-serial adapter. */
class TinyUpdiProgrammer : public Programmer {
  public:
    void program(const BuildConfig &cfg, const ProgramRequest &req) override;

    static std::vector<std::string> command(const BuildConfig &cfg, const ProgramRequest &req);
};

#endif
