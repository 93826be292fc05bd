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
 * Memory sizes of the UPDI parts we know about.
 */

#ifndef DEVICES_H
#define DEVICES_H

#include <string_view>

struct avr_device_def {
    const char *name;
    unsigned int flash_size;  // bytes
    unsigned int sram_size;   // bytes
    unsigned int eeprom_size; // bytes

    /** Look up a device by name, case insensitive.  nullptr if unknown. */
    static const avr_device_def *Find(std::string_view name);

    /** Print the table of known devices on stderr. */
    static void DumpAll();
};

#endif
