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

#ifndef __AM_UNITS__
#define __AM_UNITS__

#include <cstdint>

#include "am_coords.h"

namespace amcore {

//
// FTOM
//
// Frame buffer to map. Computed in 64 bits and never narrowed, so it cannot
// fail for any 32-bit input.
//
[[nodiscard]] auto FTOM(frame_fixed_t scale_ftom, std::int32_t x) -> std::int64_t;
[[nodiscard]] auto FTOM(frame_fixed_t scale_ftom, const fb_point_t& p) -> map_point_t;
[[nodiscard]] auto FTOM(frame_fixed_t scale_ftom, const fb_size_t& s) -> map_size_t;

//
// MTOF
//
// Map to frame buffer. The product is shifted down by FRACBITS twice, as
// e6y's int64 MTOF does. Throws fixed_overflow_error when the
// result does not fit in 32 bits.
//
[[nodiscard]] auto MTOF(map_fixed_t scale_mtof, std::int64_t x) -> std::int32_t;
[[nodiscard]] auto MTOF(map_fixed_t scale_mtof, const map_point_t& p) -> fb_point_t;
[[nodiscard]] auto MTOF(map_fixed_t scale_mtof, const map_size_t& s) -> fb_size_t;

}  // namespace amcore

#endif
