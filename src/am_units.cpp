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
 *      Translation between frame buffer and map distances.
 *
 *-----------------------------------------------------------------------------*/

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <format>

#include "am_units.h"

namespace amcore {

// ((x << FRACBITS) * scale) >> FRACBITS, with the shifts cancelled out: the
// product of a 32-bit pixel count and a 32-bit scale always fits in 64 bits.
auto FTOM(const frame_fixed_t scale_ftom, const std::int32_t x) -> std::int64_t {
  return static_cast<std::int64_t>(x) * scale_ftom.to_raw();
}

auto FTOM(const frame_fixed_t scale_ftom, const fb_point_t& p) -> map_point_t {
  return {FTOM(scale_ftom, p.x), FTOM(scale_ftom, p.y)};
}

auto FTOM(const frame_fixed_t scale_ftom, const fb_size_t& s) -> map_size_t {
  return {FTOM(scale_ftom, s.width), FTOM(scale_ftom, s.height)};
}

// e6y: int64 version to avoid overflows
auto MTOF(const map_fixed_t scale_mtof, const std::int64_t x) -> std::int32_t {
  std::int64_t product;
  if (__builtin_mul_overflow(x, static_cast<std::int64_t>(scale_mtof.to_raw()), &product)) {
    throw fixed_overflow_error{std::format("MTOF: {} * {} overflows 64 bits", x, scale_mtof.to_raw())};
  }

  return narrow_checked<std::int32_t>((product >> FRACBITS) >> FRACBITS, "MTOF");
}

auto MTOF(const map_fixed_t scale_mtof, const map_point_t& p) -> fb_point_t {
  return {MTOF(scale_mtof, p.x), MTOF(scale_mtof, p.y)};
}

auto MTOF(const map_fixed_t scale_mtof, const map_size_t& s) -> fb_size_t {
  return {MTOF(scale_mtof, s.width), MTOF(scale_mtof, s.height)};
}

}  // namespace amcore
