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
 * This file drives the tinyupdi.py programmer script.
 */

#include "avrforge.h"
#include "process.h"
#include "programmer.h"

std::vector<std::string> TinyUpdiProgrammer::command(const BuildConfig &cfg,
                                                     const ProgramRequest &req) {
    std::vector<std::string> argv = {
        cfg.python, "-u", cfg.pymPath + "/tinyupdi.py", "-d", cfg.device,
    };

    if (req.fuses) {
        argv.push_back("--fuses");
        for (const auto &f : *req.fuses)
            argv.push_back(formatFuse(f.first, f.second));
    }
    if (req.flash) {
        argv.push_back("--flash");
        argv.push_back(*req.flash);
    }
    return argv;
}

void TinyUpdiProgrammer::program(const BuildConfig &cfg, const ProgramRequest &req) {
    if (!req.fuses && !req.flash)
        throw build_exception("nothing to program");
    if (req.fuses && req.fuses->empty())
        throw config_exception("no fuse values to burn");

    ProcessOptions opts;
    opts.cwd = cfg.workDir.c_str();

    const int status = runProcess(command(cfg, req), opts);
    if (status != 0)
        throw tool_exception("tinyupdi.py", status);
}
