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
 * This file measures ELF sections with libbfd, as an alternative to
 * running avr-size.
 */

#include <cstdio>
#include <sys/stat.h>

#include <bfd.h>

#include "avrforge.h"
#include "elfimage.h"

// Check that the file is a plain object, not an archive or something
// bfd cannot tell apart.  Returns an error text, or nullptr if usable.
static const char *check_file_format(bfd *file) {
    char **matching;

    if (bfd_check_format(file, bfd_archive))
        return "input file is an archive";

    if (bfd_check_format_matches(file, bfd_object, &matching))
        return nullptr;

    if (bfd_get_error() == bfd_error_file_ambiguously_recognized)
        return "file format ambiguous";

    return bfd_errmsg(bfd_get_error());
}

ElfImage::ElfImage(const std::string &path) : file(nullptr), path(path) {
    struct stat ifstat;

    if (stat(path.c_str(), &ifstat) < 0)
        throw precondition_exception(path + " does not exist; compile it first");

    bfd_init();

    file = bfd_openr(path.c_str(), nullptr);
    if (file == nullptr)
        throw precondition_exception("Could not open " + path + ": " +
                                     bfd_errmsg(bfd_get_error()));

    const char *err = check_file_format(file);
    if (err == nullptr && bfd_get_arch(file) != bfd_arch_avr)
        err = "not an AVR executable";
    if (err != nullptr) {
        const std::string reason = path + ": " + err;
        (void)bfd_close(file);
        file = nullptr;
        throw precondition_exception(reason);
    }

    debugOut("%s: format %s\n", path.c_str(), bfd_get_target(file));
}

ElfImage::~ElfImage() {
    if (file != nullptr)
        (void)bfd_close(file);
}

SectionSizes ElfImage::sizes() const {
    SectionSizes s;

    for (asection *p = file->sections; p != nullptr; p = p->next) {
        const flagword flags = bfd_section_flags(p);
        const unsigned long size = bfd_section_size(p);

        if ((flags & SEC_ALLOC) == 0)
            continue;
        if ((flags & (SEC_CODE | SEC_READONLY)) != 0)
            s.text += size;
        else if ((flags & SEC_HAS_CONTENTS) != 0)
            s.data += size;
        else
            s.bss += size;
    }
    return s;
}

void ElfImage::dumpSections() const {
    if (!debugMode)
        return;

    debugOut("Sections of %s:\n", path.c_str());
    for (asection *p = file->sections; p != nullptr; p = p->next) {
        const flagword flags = bfd_section_flags(p);

        debugOut("  %-16s size 0x%06lx lma 0x%06lx%s%s%s%s\n", bfd_section_name(p),
                 (unsigned long)bfd_section_size(p), (unsigned long)p->lma,
                 (flags & SEC_ALLOC) ? " ALLOC" : "", (flags & SEC_LOAD) ? " LOAD" : "",
                 (flags & SEC_CODE) ? " CODE" : "", (flags & SEC_READONLY) ? " READONLY" : "");
    }
}
