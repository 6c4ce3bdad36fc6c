/* Emacs style mode select   -*- C++ -*-
 *-----------------------------------------------------------------------------
 *
 *
 *  PrBoom: a Doom port merged with LxDoom and LSDLDoom
 *  based on BOOM, a modified and improved DOOM engine
 *  Copyright (C) 1999 by
 *  id Software, Chi Hoang, Lee Killough, Jim Flynn, Rand Phares, Ty Halderman
 *  Copyright (C) 1999-2000 by
 *  Jess Haas, Nicolas Kalkhof, Colin Phipps, Florian Schulze
 *  Copyright 2005, 2006 by
 *  Florian Schulze, Colin Phipps, Neil Stevens, Andrey Budko
 *
 *  This program is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU General Public License
 *  as published by the Free Software Foundation; either version 2
 *  of the License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA
 *  02111-1307, USA.
 *
 * DESCRIPTION:
 *      External non-system-specific stuff, like storing config settings.
 *
 *-----------------------------------------------------------------------------*/

#ifndef __M_MISC__
#define __M_MISC__

#include <span>
#include <string_view>

//
// MISC
//

typedef enum {
  def_none,  // Dummy entry
  def_int,   // Integer
  def_bool,  // Boolean, 0 or 1
  def_hex,   // Integer that is written out in hex, e.g. a raw fixed point value
} default_param_t;

struct default_t {
  const char* name;
  int* location;
  int defaultvalue;  // CPhipps - default value
  int minvalue;      // jff 3/3/98 minimum allowed value
  int maxvalue;      // jff 3/3/98 maximum allowed value
  default_param_t type;  // CPhipps - type of entry
};

#define UL (-123456789) /* magic number for no min or max for parameter */

auto M_Defaults() -> std::span<default_t>;
auto M_LookupDefault(std::string_view name) -> default_t*;  // killough 11/98

// Sets every setting to its default value.
void M_ResetDefaults();

// Returns false when the file could not be opened; the defaults stay.
auto M_LoadDefaults(const char* filename) -> bool;
auto M_SaveDefaults(const char* filename) -> bool;

#endif
