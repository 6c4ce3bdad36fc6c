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
 *      amtick: drives the automap from a line based script on stdin, one
 *      host action per line, and prints the automap window after each tic.
 *      Useful to check the automap by hand or from shell scripts.
 *
 *      All map quantities are raw 16.16 values.
 *
 *-----------------------------------------------------------------------------*/

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <array>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

#include "am_map.h"
#include "lprintf.h"
#include "m_argv.h"
#include "m_fixed.h"
#include "m_misc.h"
#include "tables.h"

namespace {
using namespace amcore;

struct host_state_t {
  std::optional<automap_t> automap;

  fb_size_t window{};
  frame_fixed_t scale_ftom{};
  angle_t map_angle{0};
  map_box_t boundaries{{std::numeric_limits<std::int32_t>::min(), std::numeric_limits<std::int32_t>::min()},
                       {std::numeric_limits<std::int32_t>::max(), std::numeric_limits<std::int32_t>::max()}};
};

void I_PrintRect(const automap_t& automap) {
  const auto& r = automap.rect();
  print("rect {} {} {} {}{}\n", r.origin.x, r.origin.y, r.size.width, r.size.height,
        automap.following() ? " follow" : "");
}

auto I_PanVector(const long long x, const long long y) -> std::optional<map_vector_t> {
  if (x == 0 && y == 0) {
    return std::nullopt;
  }
  return map_vector_t{x, y};
}

auto I_PanDirection(const std::string_view name) -> std::optional<pan_direction_t> {
  constexpr std::array<std::pair<std::string_view, pan_direction_t>, 5> directions{{
      {"none", pan_direction_t::none},
      {"left", pan_direction_t::left},
      {"right", pan_direction_t::right},
      {"up", pan_direction_t::up},
      {"down", pan_direction_t::down},
  }};

  for (const auto& [key, direction] : directions) {
    if (key == name) {
      return direction;
    }
  }
  return std::nullopt;
}

// Player coordinates are raw 16.16 and must fit fixed_t.
auto I_PlayerPoint(const long long x, const long long y, const int lineno) -> std::optional<player_point_t> {
  try {
    return player_point_t{narrow_checked<std::int32_t>(x, "player x"), narrow_checked<std::int32_t>(y, "player y")};
  } catch (const fixed_overflow_error& e) {
    lprintf(LO_WARN, "line %d: %s\n", lineno, e.what());
    return std::nullopt;
  }
}

// First tic of the session: the automap is opened around the player.
void I_StartAutomap(host_state_t& host, const player_point_t& player) {
  host.automap.emplace(player, host.window, host.scale_ftom);
  host.automap->set_follow(map_follow != 0);
}

//
// I_RunCommand
//
// Returns false on "quit".
//
auto I_RunCommand(host_state_t& host, const char* const line, const int lineno) -> bool {
  std::array<char, 16> cmd{};
  int consumed = 0;
  if (std::sscanf(line, "%15s%n", cmd.data(), &consumed) != 1 || cmd[0] == '#') {
    return true;
  }

  const std::string_view command{cmd.data()};
  const char* const args = line + consumed;

  long long a = 0;
  long long b = 0;
  long long c = 0;
  long long d = 0;

  if (command == "quit") {
    return false;
  }

  if (command == "tic") {
    if (std::sscanf(args, "%lld %lld", &a, &b) != 2) {
      lprintf(LO_WARN, "line %d: usage: tic PX PY\n", lineno);
      return true;
    }

    const auto position = I_PlayerPoint(a, b, lineno);
    if (!position.has_value()) {
      return true;
    }

    const player_point_t player = *position;
    if (!host.automap.has_value()) {
      I_StartAutomap(host, player);
    }

    auto& automap = *host.automap;
    if (automap.following()) {
      automap.follow_player(player);
    }

    try {
      automap.change_window_location(map_rotate != 0, host.boundaries, host.map_angle);
    } catch (const fixed_overflow_error& e) {
      lprintf(LO_ERROR, "line %d: pan ignored: %s\n", lineno, e.what());
    }

    I_PrintRect(automap);
    return true;
  }

  if (command == "bounds") {
    if (std::sscanf(args, "%lld %lld %lld %lld", &a, &b, &c, &d) != 4) {
      lprintf(LO_WARN, "line %d: usage: bounds MINX MINY MAXX MAXY\n", lineno);
      return true;
    }
    host.boundaries = map_box_t{{a, b}, {c, d}};
    return true;
  }

  if (command == "angle") {
    if (std::sscanf(args, "%lld", &a) != 1) {
      lprintf(LO_WARN, "line %d: usage: angle DEGREES\n", lineno);
      return true;
    }
    host.map_angle = AM_DegreesToAngle(static_cast<int>(a % 360));
    return true;
  }

  if (!host.automap.has_value()) {
    lprint(LO_WARN, "line {}: {} before the first tic\n", lineno, command);
    return true;
  }

  auto& automap = *host.automap;

  if (command == "pan") {
    if (std::sscanf(args, "%lld %lld %lld %lld", &a, &b, &c, &d) != 4) {
      lprintf(LO_WARN, "line %d: usage: pan KX KY MX MY\n", lineno);
      return true;
    }
    automap.update_panning(I_PanVector(a, b), I_PanVector(c, d));
  } else if (command == "key") {
    std::array<char, 16> name{};
    const auto direction = std::sscanf(args, "%15s", name.data()) == 1 ? I_PanDirection(name.data()) : std::nullopt;
    if (!direction.has_value()) {
      lprintf(LO_WARN, "line %d: usage: key left|right|up|down|none\n", lineno);
      return true;
    }
    automap.update_panning(AM_KeyboardPan(host.scale_ftom, *direction), automap.pan_mouse());
  } else if (command == "scale" || command == "window") {
    if (command == "scale") {
      if (std::sscanf(args, "%lld", &a) != 1 || a <= 0 || a > std::numeric_limits<fixed_t>::max()) {
        lprintf(LO_WARN, "line %d: usage: scale RAW\n", lineno);
        return true;
      }
      host.scale_ftom = frame_fixed_t::from_raw(static_cast<fixed_t>(a));
    } else {
      if (std::sscanf(args, "%lld %lld", &a, &b) != 2 || a <= 0 || b <= 0 || a > 8192 || b > 8192) {
        lprintf(LO_WARN, "line %d: usage: window W H\n", lineno);
        return true;
      }
      host.window = amcore::fb_size_t{static_cast<std::int32_t>(a), static_cast<std::int32_t>(b)};
    }
    automap.activate_new_scale(host.window, host.scale_ftom);
  } else if (command == "save") {
    automap.save_rect();
  } else if (command == "restore") {
    if (std::sscanf(args, "%lld %lld", &a, &b) != 2) {
      lprintf(LO_WARN, "line %d: usage: restore PX PY\n", lineno);
      return true;
    }
    const auto position = I_PlayerPoint(a, b, lineno);
    if (!position.has_value()) {
      return true;
    }
    automap.restore_rect(*position);
  } else if (command == "follow") {
    if (std::sscanf(args, "%lld", &a) != 1) {
      lprintf(LO_WARN, "line %d: usage: follow 0|1\n", lineno);
      return true;
    }
    automap.set_follow(a != 0);
  } else if (command == "print") {
    I_PrintRect(automap);
  } else {
    lprint(LO_WARN, "line {}: unknown command {}\n", lineno, command);
  }

  return true;
}
}  // namespace

auto main(int argc, char** argv) -> int {
  M_InitArgv(argc, argv);

  if (M_CheckParm("-debug") != 0) {
    cons_output_mask |= LO_DEBUG;
  }

  const char* config = AMCORE_DEFAULT_CONFIG;
  if (M_CheckParm("-config") != 0) {
    config = M_ParmValue("-config");
    if (config == nullptr) {
      I_Error("Error: -config requires a file name");
    }
  }

  lprintf(LO_INFO, "%s\n", PACKAGE_STRING);
  M_LoadDefaults(config);

  if (M_CheckParm("-nofollow") != 0) {
    map_follow = 0;
  }
  if (M_CheckParm("-rotate") != 0) {
    map_rotate = 1;
  }
  if (M_CheckParm("-savecfg") != 0 && !M_SaveDefaults(config)) {
    I_Error("Error: could not save %s", config);
  }

  host_state_t host;
  host.window = amcore::fb_size_t{map_window_width, map_window_height};
  host.scale_ftom = amcore::frame_fixed_t::from_raw(map_scale_ftom);

  std::array<char, 512> line;
  int lineno = 0;
  while (std::fgets(line.data(), static_cast<int>(line.size()), stdin) != nullptr) {
    if (!I_RunCommand(host, line.data(), ++lineno)) {
      break;
    }
  }

  return EXIT_SUCCESS;
}
