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
 *      Automap coordinate types.
 *
 *  Frame buffer geometry is stored in 32 bits; map geometry in 64 bits, as
 *  map distances can leave the 32-bit range once scaled. The unit parameter
 *  keeps the two spaces apart: converting between them goes through the
 *  FTOM/MTOF transforms in am_units.h.
 *
 *-----------------------------------------------------------------------------*/

#ifndef __AM_COORDS__
#define __AM_COORDS__

#include <cstdint>

#include "m_fixed.h"

namespace amcore {

struct frame_unit {};    // frame buffer pixels
struct map_unit {};      // automap distance units
struct unknown_unit {};  // positions handed over by the host

template<typename T, typename Unit>
struct vector2d {
  T x{};
  T y{};

  [[nodiscard]] constexpr auto is_zero() const noexcept -> bool { return x == 0 && y == 0; }

  friend constexpr auto operator==(const vector2d&, const vector2d&) noexcept -> bool = default;

  constexpr auto operator+=(const vector2d& v) noexcept -> vector2d& {
    x += v.x;
    y += v.y;
    return *this;
  }
};

template<typename T, typename Unit>
constexpr auto operator+(vector2d<T, Unit> a, const vector2d<T, Unit>& b) noexcept -> vector2d<T, Unit> {
  return a += b;
}

template<typename T, typename Unit>
struct point2d {
  T x{};
  T y{};

  friend constexpr auto operator==(const point2d&, const point2d&) noexcept -> bool = default;

  constexpr auto operator+=(const vector2d<T, Unit>& v) noexcept -> point2d& {
    x += v.x;
    y += v.y;
    return *this;
  }

  constexpr auto operator-=(const vector2d<T, Unit>& v) noexcept -> point2d& {
    x -= v.x;
    y -= v.y;
    return *this;
  }
};

template<typename T, typename Unit>
constexpr auto operator+(point2d<T, Unit> p, const vector2d<T, Unit>& v) noexcept -> point2d<T, Unit> {
  return p += v;
}

template<typename T, typename Unit>
constexpr auto operator-(point2d<T, Unit> p, const vector2d<T, Unit>& v) noexcept -> point2d<T, Unit> {
  return p -= v;
}

template<typename T, typename Unit>
struct size2d {
  T width{};
  T height{};

  // Vector from a corner to the center, rounded towards zero.
  [[nodiscard]] constexpr auto half() const noexcept -> vector2d<T, Unit> { return {width / 2, height / 2}; }

  friend constexpr auto operator==(const size2d&, const size2d&) noexcept -> bool = default;
};

template<typename T, typename Unit>
struct rect2d {
  point2d<T, Unit> origin{};
  size2d<T, Unit> size{};

  [[nodiscard]] constexpr auto max() const noexcept -> point2d<T, Unit> {
    return {origin.x + size.width, origin.y + size.height};
  }

  friend constexpr auto operator==(const rect2d&, const rect2d&) noexcept -> bool = default;
};

template<typename T, typename Unit>
struct box2d {
  point2d<T, Unit> min{};
  point2d<T, Unit> max{};

  friend constexpr auto operator==(const box2d&, const box2d&) noexcept -> bool = default;
};

using fb_point_t = point2d<std::int32_t, frame_unit>;
using fb_size_t = size2d<std::int32_t, frame_unit>;

using map_point_t = point2d<std::int64_t, map_unit>;
using map_size_t = size2d<std::int64_t, map_unit>;
using map_rect_t = rect2d<std::int64_t, map_unit>;
using map_vector_t = vector2d<std::int64_t, map_unit>;
using map_box_t = box2d<std::int64_t, map_unit>;

using player_point_t = point2d<std::int32_t, unknown_unit>;

using frame_fixed_t = fixed_point<frame_unit>;
using map_fixed_t = fixed_point<map_unit>;

}  // namespace amcore

#endif
