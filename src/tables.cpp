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
 *      Lookup tables.
 *      Do not try to look them up :-).
 *
 *  The sine table covers five quarter turns so that the cosine can be read
 *  from the same storage, FINEANGLES/4 entries further on.
 *
 *-----------------------------------------------------------------------------*/

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <cmath>

#include <array>
#include <numbers>

#include "tables.h"

namespace amcore {
namespace {
using finesine_table_t = std::array<fixed_t, 5 * FINEANGLES / 4>;

auto R_BuildSineTable() -> finesine_table_t {
  finesine_table_t table{};

  for (std::size_t i = 0; i < table.size(); i++) {
    const double a = static_cast<double>(i) * 2.0 * std::numbers::pi / FINEANGLES;
    table[i] = static_cast<fixed_t>(std::lround(std::sin(a) * FRACUNIT));
  }

  // The quarter turns must be exact for rotations to be lossless.
  for (std::size_t i = 0; i < table.size(); i += FINEANGLES / 4) {
    switch ((i / (FINEANGLES / 4)) % 4) {
      case 0:
      case 2:
        table[i] = 0;
        break;
      case 1:
        table[i] = FRACUNIT;
        break;
      default:
        table[i] = -FRACUNIT;
        break;
    }
  }

  return table;
}

auto finesine() -> const finesine_table_t& {
  static const finesine_table_t table = R_BuildSineTable();
  return table;
}
}  // namespace

auto fine_sine(const angle_t angle) -> fixed_t {
  return finesine()[(angle >> ANGLETOFINESHIFT) & FINEMASK];
}

auto fine_cosine(const angle_t angle) -> fixed_t {
  return finesine()[((angle >> ANGLETOFINESHIFT) & FINEMASK) + FINEANGLES / 4];
}

auto AM_DegreesToAngle(const int degrees) -> angle_t {
  const int wrapped = ((degrees % 360) + 360) % 360;
  return static_cast<angle_t>((static_cast<std::uint64_t>(wrapped) << 32) / 360);
}

}  // namespace amcore
