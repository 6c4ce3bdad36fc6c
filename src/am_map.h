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
 *  AutoMap module.
 *
 *  automap_t keeps the automap window (in map coordinates) of one level
 *  session. The host feeds it once per tic: the player position, the pan
 *  deltas read from keyboard and mouse, the map boundaries and the angle to
 *  rotate panning by. Drawing is left to the caller, which reads rect().
 *
 *-----------------------------------------------------------------------------*/

#ifndef __AMMAP_H__
#define __AMMAP_H__

#include <optional>

#include "am_coords.h"
#include "tables.h"

// Automap settings, see m_misc.cpp for their defaults.
extern int map_scroll_speed;
extern int map_follow;
extern int map_rotate;
extern int map_scale_ftom;
extern int map_window_width;
extern int map_window_height;

namespace amcore {

enum class pan_direction_t { none, left, right, up, down };

// Keyboard pan for one tic: map_scroll_speed frame buffer pixels in the
// given direction, expressed in map units.
[[nodiscard]] auto AM_KeyboardPan(frame_fixed_t scale_ftom, pan_direction_t direction) -> std::optional<map_vector_t>;

class automap_t {
 public:
  automap_t(const player_point_t& player, const fb_size_t& window, frame_fixed_t scale_ftom);

  void update_panning(std::optional<map_vector_t> pan_keyboard, std::optional<map_vector_t> pan_mouse);

  //
  // Moves the window by the pending pan deltas, leaving follow mode.
  // The mouse delta is consumed, the keyboard one stays until replaced.
  // Throws fixed_overflow_error (with nothing modified) if rotation
  // cannot be carried out in 16.16, or if the pan leaves the 64-bit map
  // range.
  //
  void change_window_location(bool rotate, const map_box_t& boundaries, angle_t map_angle);

  // Resizes the window for a new scale, keeping its center.
  void activate_new_scale(const fb_size_t& window, frame_fixed_t scale_ftom);

  void save_rect();
  void restore_rect(const player_point_t& player);

  void follow_player(const player_point_t& player);
  void set_follow(bool follow);

  [[nodiscard]] static auto rotate(const map_vector_t& v, angle_t map_angle) -> map_vector_t;

  [[nodiscard]] auto rect() const -> const map_rect_t& { return _rect; }
  [[nodiscard]] auto saved_rect() const -> const map_rect_t& { return _saved_rect; }
  [[nodiscard]] auto following() const -> bool { return _follow_player; }
  [[nodiscard]] auto frame_zoom() const -> frame_fixed_t { return _frame_zoom_multiplier; }
  [[nodiscard]] auto map_zoom() const -> map_fixed_t { return _map_zoom_multiplier; }
  [[nodiscard]] auto pan_keyboard() const -> const std::optional<map_vector_t>& { return _pan_keyboard; }
  [[nodiscard]] auto pan_mouse() const -> const std::optional<map_vector_t>& { return _pan_mouse; }

 private:
  bool _follow_player{true};
  std::optional<player_point_t> _follow_old_location;

  std::optional<map_vector_t> _pan_keyboard;
  std::optional<map_vector_t> _pan_mouse;

  // not used for zooming yet, always FRACUNIT
  frame_fixed_t _frame_zoom_multiplier{frame_fixed_t::unit()};
  map_fixed_t _map_zoom_multiplier{map_fixed_t::unit()};

  map_rect_t _rect;
  map_rect_t _saved_rect;
};

}  // namespace amcore

#endif
