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
 *  C interface to the automap.
 *
 *  Exceptions never leave this file: an overflow inside the automap turns
 *  into I_Error, as does a NULL handle.
 *
 *-----------------------------------------------------------------------------*/

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <optional>
#include <utility>

#include "am_capi.h"
#include "am_map.h"
#include "lprintf.h"

struct automap_handle_s {
  amcore::automap_t automap;
};

namespace {
using amcore::automap_t;
using amcore::fixed_overflow_error;
using amcore::map_vector_t;

auto AM_Deref(automap_handle_t* const handle, const char* const func) -> automap_t& {
  if (handle == nullptr) {
    I_Error("%s: null passed as automap", func);
  }
  return handle->automap;
}

auto AM_Deref(const automap_handle_t* const handle, const char* const func) -> const automap_t& {
  if (handle == nullptr) {
    I_Error("%s: null passed as automap", func);
  }
  return handle->automap;
}

template<typename F>
void AM_Guard(const char* const func, F&& f) {
  try {
    std::forward<F>(f)();
  } catch (const fixed_overflow_error& e) {
    I_Error("%s: %s", func, e.what());
  }
}

auto AM_PanFromC(const std::int64_t x, const std::int64_t y) -> std::optional<map_vector_t> {
  if (x == 0 && y == 0) {
    return std::nullopt;
  }
  return map_vector_t{x, y};
}
}  // namespace

auto AM_New(const std::int32_t player_x,
            const std::int32_t player_y,
            const std::int32_t window_width,
            const std::int32_t window_height,
            const std::int32_t scale_ftom) -> automap_handle_t* {
  return new automap_handle_t{automap_t{{player_x, player_y},
                                        {window_width, window_height},
                                        amcore::frame_fixed_t::from_raw(scale_ftom)}};
}

void AM_Free(automap_handle_t* const automap) {
  delete automap;
}

void AM_ChangeWindowLoc(automap_handle_t* const automap,
                        const bool rotate,
                        const std::uint32_t map_angle,
                        const std::int64_t min_x,
                        const std::int64_t min_y,
                        const std::int64_t max_x,
                        const std::int64_t max_y) {
  auto& am = AM_Deref(automap, __func__);
  AM_Guard(__func__, [&] {
    am.change_window_location(rotate, amcore::map_box_t{{min_x, min_y}, {max_x, max_y}}, map_angle);
  });
}

void AM_ActivateNewScale(automap_handle_t* const automap,
                         const std::int32_t window_width,
                         const std::int32_t window_height,
                         const std::int32_t scale_ftom) {
  AM_Deref(automap, __func__)
      .activate_new_scale({window_width, window_height}, amcore::frame_fixed_t::from_raw(scale_ftom));
}

void AM_UpdatePanning(automap_handle_t* const automap,
                      const std::int64_t pan_keyboard_x,
                      const std::int64_t pan_keyboard_y,
                      const std::int64_t pan_mouse_x,
                      const std::int64_t pan_mouse_y) {
  AM_Deref(automap, __func__)
      .update_panning(AM_PanFromC(pan_keyboard_x, pan_keyboard_y), AM_PanFromC(pan_mouse_x, pan_mouse_y));
}

void AM_SaveRect(automap_handle_t* const automap) {
  AM_Deref(automap, __func__).save_rect();
}

void AM_RestoreRect(automap_handle_t* const automap, const std::int32_t player_x, const std::int32_t player_y) {
  AM_Deref(automap, __func__).restore_rect({player_x, player_y});
}

void AM_FollowPlayer(automap_handle_t* const automap, const std::int32_t player_x, const std::int32_t player_y) {
  AM_Deref(automap, __func__).follow_player({player_x, player_y});
}

void AM_SetFollow(automap_handle_t* const automap, const bool follow) {
  AM_Deref(automap, __func__).set_follow(follow);
}

auto AM_IsFollowing(const automap_handle_t* const automap) -> bool {
  return AM_Deref(automap, __func__).following();
}

void AM_GetRect(const automap_handle_t* const automap,
                std::int64_t* const x,
                std::int64_t* const y,
                std::int64_t* const width,
                std::int64_t* const height) {
  const auto& rect = AM_Deref(automap, __func__).rect();

  if (x != nullptr) {
    *x = rect.origin.x;
  }
  if (y != nullptr) {
    *y = rect.origin.y;
  }
  if (width != nullptr) {
    *width = rect.size.width;
  }
  if (height != nullptr) {
    *height = rect.size.height;
  }
}

void AM_PrintRect(const automap_handle_t* const automap) {
  const auto& rect = AM_Deref(automap, __func__).rect();

  lprint(LO_ALWAYS, "automap rect: origin ({}, {}) size ({}, {})\n", rect.origin.x, rect.origin.y, rect.size.width,
         rect.size.height);
}
