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
 *      Fixed point arithmetics, implementation.
 *
 *  16.16 fixed point values tagged with the coordinate space they belong to,
 *  so that frame buffer and map quantities cannot be mixed by accident.
 *  Multiplication refuses to wrap; division saturates the way Doom's
 *  FixedDiv does.
 *
 *-----------------------------------------------------------------------------*/

#ifndef __M_FIXED__
#define __M_FIXED__

#include <cstdint>
#include <cstdlib>

#include <format>
#include <limits>
#include <stdexcept>
#include <string_view>

//
// Fixed point, 32bit as 16.16.
//

constexpr int FRACBITS = 16;
constexpr int FRACUNIT = 1 << FRACBITS;

using fixed_t = std::int32_t;

namespace amcore {

// Raised when a fixed point product or a narrowing conversion between
// coordinate spaces does not fit the destination type.
class fixed_overflow_error : public std::overflow_error {
 public:
  using std::overflow_error::overflow_error;
};

template<typename To, typename From>
[[nodiscard]] auto narrow_checked(const From value, const std::string_view what) -> To {
  if (value < static_cast<From>(std::numeric_limits<To>::min()) ||
      value > static_cast<From>(std::numeric_limits<To>::max())) {
    throw fixed_overflow_error{std::format("{}: {} does not fit into {} bits", what, value, sizeof(To) * 8)};
  }
  return static_cast<To>(value);
}

template<typename Unit>
class fixed_point {
 public:
  using unit_type = Unit;

  constexpr fixed_point() noexcept = default;

  constexpr explicit fixed_point(const fixed_t raw) noexcept : _raw{raw} {}

  [[nodiscard]] static constexpr auto unit() noexcept -> fixed_point { return fixed_point{FRACUNIT}; }

  [[nodiscard]] static constexpr auto from_raw(const fixed_t raw) noexcept -> fixed_point { return fixed_point{raw}; }

  [[nodiscard]] constexpr auto to_raw() const noexcept -> fixed_t { return _raw; }

  friend constexpr auto operator==(fixed_point, fixed_point) noexcept -> bool = default;

 private:
  fixed_t _raw{0};
};

//
// FixedMul
//
// Throws fixed_overflow_error instead of truncating the 64-bit product.
//
template<typename Unit>
[[nodiscard]] auto FixedMul(const fixed_point<Unit> a, const fixed_point<Unit> b) -> fixed_point<Unit> {
  const auto product = (static_cast<std::int64_t>(a.to_raw()) * b.to_raw()) >> FRACBITS;
  return fixed_point<Unit>{narrow_checked<fixed_t>(product, "FixedMul")};
}

//
// FixedDiv, C version.
//
// When the quotient cannot be represented the result saturates to INT_MIN or
// INT_MAX depending on the signs of the operands. Dividing by zero lands in
// the same branch.
//
template<typename Unit>
[[nodiscard]] auto FixedDiv(const fixed_point<Unit> a, const fixed_point<Unit> b) -> fixed_point<Unit> {
  const std::int64_t ra = a.to_raw();
  const std::int64_t rb = b.to_raw();

  if ((std::abs(ra) >> 14) >= std::abs(rb)) {
    return fixed_point<Unit>{(ra ^ rb) < 0 ? std::numeric_limits<fixed_t>::min()
                                           : std::numeric_limits<fixed_t>::max()};
  }

  return fixed_point<Unit>{narrow_checked<fixed_t>((ra << FRACBITS) / rb, "FixedDiv")};
}

template<typename Unit>
[[nodiscard]] auto operator*(const fixed_point<Unit> a, const fixed_point<Unit> b) -> fixed_point<Unit> {
  return FixedMul(a, b);
}

template<typename Unit>
[[nodiscard]] auto operator/(const fixed_point<Unit> a, const fixed_point<Unit> b) -> fixed_point<Unit> {
  return FixedDiv(a, b);
}

}  // namespace amcore

#endif
