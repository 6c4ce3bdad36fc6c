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
 *
 *      finesine[10240] - Sine lookup, serves as cosine too.
 *      Indexed by the top 13 bits of a BAM angle.
 *      Built on first use.
 *
 *-----------------------------------------------------------------------------*/

#ifndef __TABLES__
#define __TABLES__

#include <cstdint>

#include "m_fixed.h"

// 0x100000000 to 0x2000
constexpr int ANGLETOFINESHIFT = 19;

constexpr int FINEANGLES = 8192;
constexpr int FINEMASK = FINEANGLES - 1;

// Binary Angle Measument, BAM.
using angle_t = std::uint32_t;

constexpr angle_t ANG45 = 0x20000000;
constexpr angle_t ANG90 = 0x40000000;
constexpr angle_t ANG180 = 0x80000000;
constexpr angle_t ANG270 = 0xc0000000;

namespace amcore {

// Raw 16.16 sine and cosine of a binary angle. Pure after the table has
// been built; the build itself is guarded by static initialization.
[[nodiscard]] auto fine_sine(angle_t angle) -> fixed_t;
[[nodiscard]] auto fine_cosine(angle_t angle) -> fixed_t;

// Host convenience, 0..360 degrees wrap around.
[[nodiscard]] auto AM_DegreesToAngle(int degrees) -> angle_t;

}  // namespace amcore

#endif
