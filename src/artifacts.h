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
 * Build artifact bookkeeping.
 */

#ifndef ARTIFACTS_H
#define ARTIFACTS_H

#include <string>

/** Shell patterns of the files the compiler may leave behind,
    terminated by nullptr. */
extern const char *const intermediatePatterns[];

/** Extensions of the final artifacts, terminated by nullptr. */
extern const char *const artifactExtensions[];

/** Delete path.  A missing file is not an error.  Returns true if
    something was removed. **/
bool removeArtifact(const std::string &path);

/** Delete every file in dir matching pattern.  Returns the count. **/
unsigned int removeMatching(const std::string &dir, const char *pattern);

/** True if path exists as a regular file. **/
bool artifactExists(const std::string &path);

#endif
