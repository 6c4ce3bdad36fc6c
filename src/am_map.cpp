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
 *   the automap code
 *
 *-----------------------------------------------------------------------------
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <cstdint>

#include <format>
#include <optional>

#include "am_map.h"
#include "am_units.h"
#include "lprintf.h"  // jff 08/03/98 - declaration of lprintf
#include "m_fixed.h"
#include "tables.h"

int map_scroll_speed = 8;
int map_follow = 1;
int map_rotate = 0;
int map_scale_ftom = FRACUNIT;
int map_window_width = 320;
int map_window_height = 200;

namespace amcore {
namespace {
// window origin that puts the player in the middle
auto AM_centerOn(const player_point_t& player, const map_size_t& size) -> map_point_t {
  const auto half = size.half();
  return {static_cast<std::int64_t>(player.x) - half.x, static_cast<std::int64_t>(player.y) - half.y};
}

// a zero delta means the key or the mouse is idle
auto AM_activePan(const std::optional<map_vector_t>& pan) -> std::optional<map_vector_t> {
  if (pan.has_value() && !pan->is_zero()) {
    return pan;
  }
  return std::nullopt;
}

// Map geometry is 64-bit; a pan that leaves that range is an error, not a wrap.
auto AM_add(const std::int64_t a, const std::int64_t b) -> std::int64_t {
  std::int64_t sum;
  if (__builtin_add_overflow(a, b, &sum)) {
    throw fixed_overflow_error{std::format("AM_changeWindowLoc: {} + {} overflows 64 bits", a, b)};
  }
  return sum;
}

auto AM_sub(const std::int64_t a, const std::int64_t b) -> std::int64_t {
  std::int64_t diff;
  if (__builtin_sub_overflow(a, b, &diff)) {
    throw fixed_overflow_error{std::format("AM_changeWindowLoc: {} - {} overflows 64 bits", a, b)};
  }
  return diff;
}

void AM_logRect(const char* const what, const map_rect_t& r) {
  lprint(LO_DEBUG, "{}: origin ({}, {}) size ({}, {})\n", what, r.origin.x, r.origin.y, r.size.width, r.size.height);
}
}  // namespace

auto AM_KeyboardPan(const frame_fixed_t scale_ftom, const pan_direction_t direction) -> std::optional<map_vector_t> {
  const std::int64_t paninc = FTOM(scale_ftom, map_scroll_speed);

  switch (direction) {
    case pan_direction_t::right:
      return map_vector_t{paninc, 0};
    case pan_direction_t::left:
      return map_vector_t{-paninc, 0};
    case pan_direction_t::up:
      return map_vector_t{0, paninc};
    case pan_direction_t::down:
      return map_vector_t{0, -paninc};
    case pan_direction_t::none:
      break;
  }

  return std::nullopt;
}

automap_t::automap_t(const player_point_t& player, const fb_size_t& window, const frame_fixed_t scale_ftom) {
  _rect.size = FTOM(scale_ftom, window);
  _rect.origin = AM_centerOn(player, _rect.size);

  // for saving & restoring
  _saved_rect = _rect;

  AM_logRect("AM_New", _rect);
}

void automap_t::update_panning(const std::optional<map_vector_t> pan_keyboard,
                               const std::optional<map_vector_t> pan_mouse) {
  _pan_keyboard = pan_keyboard;
  _pan_mouse = pan_mouse;
}

//
// AM_changeWindowLoc()
//
// Moves the map window by the pending pan increments and keeps its center
// inside the level boundaries, each axis on its own.
//
void automap_t::change_window_location(const bool rotate, const map_box_t& boundaries, const angle_t map_angle) {
  const auto keyboard = AM_activePan(_pan_keyboard);
  const auto mouse = AM_activePan(_pan_mouse);

  if (!keyboard.has_value() && !mouse.has_value()) {
    return;
  }

  map_vector_t pan;
  if (keyboard.has_value() && mouse.has_value()) {
    pan = {AM_add(keyboard->x, mouse->x), AM_add(keyboard->y, mouse->y)};
  } else {
    pan = keyboard.has_value() ? *keyboard : *mouse;
  }

  if (rotate) {
    pan = automap_t::rotate(pan, map_angle);
  }

  const auto half = _rect.size.half();
  map_point_t origin{AM_add(_rect.origin.x, pan.x), AM_add(_rect.origin.y, pan.y)};
  const map_point_t center{AM_add(origin.x, half.x), AM_add(origin.y, half.y)};

  if (center.x > boundaries.max.x) {
    origin.x = AM_sub(boundaries.max.x, half.x);
  } else if (center.x < boundaries.min.x) {
    origin.x = AM_sub(boundaries.min.x, half.x);
  }

  if (center.y > boundaries.max.y) {
    origin.y = AM_sub(boundaries.max.y, half.y);
  } else if (center.y < boundaries.min.y) {
    origin.y = AM_sub(boundaries.min.y, half.y);
  }

  // any manual pan leaves follow mode
  _follow_player = false;
  _follow_old_location.reset();
  _pan_mouse.reset();
  _rect.origin = origin;

  AM_logRect("AM_changeWindowLoc", _rect);
}

//
// AM_rotate()
//
// Rotation in 2D, done in 16.16 like the rest of the automap.
//
// CPhipps - made static & enhanced for automap rotation
auto automap_t::rotate(const map_vector_t& v, const angle_t map_angle) -> map_vector_t {
  const auto x = map_fixed_t{narrow_checked<fixed_t>(v.x, "AM_rotate")};
  const auto y = map_fixed_t{narrow_checked<fixed_t>(v.y, "AM_rotate")};
  const auto sine = map_fixed_t{fine_sine(map_angle)};
  const auto cosine = map_fixed_t{fine_cosine(map_angle)};

  const std::int64_t tmpx = static_cast<std::int64_t>((x * cosine).to_raw()) - (y * sine).to_raw();
  const std::int64_t tmpy = static_cast<std::int64_t>((x * sine).to_raw()) + (y * cosine).to_raw();

  return {tmpx, tmpy};
}

//
// AM_activateNewScale()
//
// Changes the map scale after zooming or translating
//
void automap_t::activate_new_scale(const fb_size_t& window, const frame_fixed_t scale_ftom) {
  auto r = _rect;

  r.origin += r.size.half();
  r.size = FTOM(scale_ftom, window);
  r.origin -= r.size.half();

  _rect = r;

  AM_logRect("AM_activateNewScale", _rect);
}

//
// AM_saveScaleAndLoc()
//
void automap_t::save_rect() {
  _saved_rect = _rect;
}

//
// AM_restoreScaleAndLoc()
//
// A following automap is put back around the player, who may have moved
// since the rect was saved.
//
void automap_t::restore_rect(const player_point_t& player) {
  _rect.size = _saved_rect.size;
  if (!_follow_player) {
    _rect.origin = _saved_rect.origin;
  } else {
    _rect.origin = AM_centerOn(player, _saved_rect.size);
  }
}

//
// AM_doFollowPlayer()
//
// Turn on follow mode - the map scrolls opposite to player motion
//
void automap_t::follow_player(const player_point_t& player) {
  if (_follow_old_location == player) {
    return;
  }

  _rect.origin = AM_centerOn(player, _rect.size);
  _follow_old_location = player;

  AM_logRect("AM_doFollowPlayer", _rect);
}

void automap_t::set_follow(const bool follow) {
  _follow_player = follow;
  if (follow) {
    _follow_old_location.reset();
  }
}

}  // namespace amcore
