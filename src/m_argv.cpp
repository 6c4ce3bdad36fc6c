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
 *  Some argument handling.
 *
 *-----------------------------------------------------------------------------*/

#include <algorithm>
#include <cctype>
#include <string_view>

#include "m_argv.h"

int myargc;
const char* const* myargv;

namespace {
auto M_StrEqualNoCase(const std::string_view a, const std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](const unsigned char l, const unsigned char r) {
    return std::tolower(l) == std::tolower(r);
  });
}
}  // namespace

void M_InitArgv(const int argc, const char* const* const argv) {
  myargc = argc;
  myargv = argv;
}

//
// M_CheckParm
// Checks for the given parameter
// in the program's command line arguments.
// Returns the argument number (1 to argc-1)
// or 0 if not present
//

auto M_CheckParm(const std::string_view check) -> int {
  for (int i = 1; i < myargc; i++) {
    if (M_StrEqualNoCase(check, myargv[i])) {  // killough 3/20/98
      return i;
    }
  }

  return 0;
}

auto M_ParmValue(const std::string_view check) -> const char* {
  const int p = M_CheckParm(check);
  if (p != 0 && p < myargc - 1) {
    return myargv[p + 1];
  }
  return nullptr;
}
