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
 * Read access to a linked AVR ELF file through libbfd.
 */

#ifndef ELFIMAGE_H
#define ELFIMAGE_H

#include <string>

#include "toolchain.h"

struct bfd;

class ElfImage {
    bfd *file;
    std::string path;

  public:
    /** Open path and make sure it is an AVR object file.
        Throws precondition_exception if it is missing or unusable. **/
    explicit ElfImage(const std::string &path);
    ~ElfImage();

    ElfImage(const ElfImage &) = delete;
    ElfImage &operator=(const ElfImage &) = delete;

    /** Sum the allocated sections the way "size" does in Berkeley
        format. **/
    SectionSizes sizes() const;

    /** List every section with its size and flags on the debug
        output. **/
    void dumpSections() const;
};

#endif
