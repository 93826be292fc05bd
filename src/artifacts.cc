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
 */

#include <cerrno>
#include <cstring>
#include <glob.h>
#include <sys/stat.h>
#include <unistd.h>

#include "artifacts.h"
#include "avrforge.h"

const char *const intermediatePatterns[] = {
    "*.lst", "*.obj", "*.cof", "*.list", "*.map", "*.eep.hex", "*.o", "*.s", "*.d", nullptr,
};

const char *const artifactExtensions[] = {"elf", "bin", "hex", "asm", nullptr};

bool removeArtifact(const std::string &path) {
    if (unlink(path.c_str()) == 0) {
        debugOut("removed %s\n", path.c_str());
        return true;
    }
    if (errno == ENOENT)
        return false;
    throw build_exception("cannot remove " + path + ": " + strerror(errno));
}

unsigned int removeMatching(const std::string &dir, const char *pattern) {
    std::string globexpr = dir.empty() ? std::string(".") : dir;
    if (globexpr.back() != '/')
        globexpr += '/';
    globexpr += pattern;

    glob_t g;
    const int rv = glob(globexpr.c_str(), 0, nullptr, &g);
    if (rv == GLOB_NOMATCH)
        return 0;
    if (rv != 0)
        throw build_exception("cannot expand " + globexpr);

    unsigned int count = 0;
    try {
        for (size_t i = 0; i < g.gl_pathc; i++) {
            if (artifactExists(g.gl_pathv[i]) && removeArtifact(g.gl_pathv[i]))
                count++;
        }
    } catch (build_exception &) {
        globfree(&g);
        throw;
    }
    globfree(&g);

    return count;
}

bool artifactExists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}
