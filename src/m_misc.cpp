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
 *  Main loop menu stuff.
 *  Default Config File.
 *
 *-----------------------------------------------------------------------------*/

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <array>
#include <charconv>
#include <limits>
#include <memory>
#include <string_view>

#include "am_map.h"
#include "lprintf.h"
#include "m_fixed.h"
#include "m_misc.h"

namespace {
std::array<default_t, 7> defaults{{
    {"Automap settings", nullptr, 0, UL, UL, def_none},
    {"map_scroll_speed", &map_scroll_speed, 8, 1, 32, def_int},  // keyboard pan, pixels per tic
    {"map_follow", &map_follow, 1, 0, 1, def_bool},
    {"map_rotate", &map_rotate, 0, 0, 1, def_bool},
    {"map_scale_ftom", &map_scale_ftom, FRACUNIT, 1, 1 << 24, def_hex},  // frame buffer to map, 16.16
    {"map_window_width", &map_window_width, 320, 1, 8192, def_int},
    {"map_window_height", &map_window_height, 200, 1, 8192, def_int},
}};

auto M_Trim(std::string_view s) -> std::string_view {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

auto M_ParseInt(std::string_view s, int& value) -> bool {
  int base = 10;
  bool negative = false;

  if (!s.empty() && s.front() == '-') {
    negative = true;
    s.remove_prefix(1);
  }

  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s.remove_prefix(2);
  }

  // one sign only, ahead of any 0x
  if (s.empty() || std::isxdigit(static_cast<unsigned char>(s.front())) == 0) {
    return false;
  }

  long long parsed = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed, base);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return false;
  }

  if (negative) {
    parsed = -parsed;
  }

  if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
    return false;
  }

  value = static_cast<int>(parsed);
  return true;
}

// jff 3/3/98 range checking of config values
auto M_InRange(const default_t& def, const int value) -> bool {
  return (def.minvalue == UL || value >= def.minvalue) && (def.maxvalue == UL || value <= def.maxvalue);
}
}  // namespace

auto M_Defaults() -> std::span<default_t> {
  return defaults;
}

auto M_LookupDefault(const std::string_view name) -> default_t* {
  for (auto& def : defaults) {
    if (def.type != def_none && name == def.name) {
      return &def;
    }
  }
  return nullptr;
}

void M_ResetDefaults() {
  for (auto& def : defaults) {
    if (def.location != nullptr) {
      *def.location = def.defaultvalue;
    }
  }
}

//
// M_LoadDefaults
//
// Each line holds a setting name and its value. Lines starting with # or ;
// are comments, as are blank lines.
//
auto M_LoadDefaults(const char* const filename) -> bool {
  // set everything to base values
  M_ResetDefaults();

  const auto f = std::unique_ptr<std::FILE, decltype(&std::fclose)>{std::fopen(filename, "r"), &std::fclose};
  if (f == nullptr) {
    lprintf(LO_INFO, " default file %s not found, using defaults\n", filename);
    return false;
  }

  lprintf(LO_INFO, " default file: %s\n", filename);

  std::array<char, 256> buf;
  int line = 0;
  while (std::fgets(buf.data(), static_cast<int>(buf.size()), f.get()) != nullptr) {
    line++;

    const auto text = M_Trim(buf.data());
    if (text.empty() || text.front() == '#' || text.front() == ';') {
      continue;
    }

    const auto split = text.find_first_of(" \t");
    if (split == std::string_view::npos) {
      lprintf(LO_WARN, "M_LoadDefaults: %s:%d: missing value\n", filename, line);
      continue;
    }

    const auto name = text.substr(0, split);
    const auto value_text = M_Trim(text.substr(split));

    default_t* const def = M_LookupDefault(name);
    if (def == nullptr) {
      lprint(LO_WARN, "M_LoadDefaults: {}:{}: unknown setting {}\n", filename, line, name);
      continue;
    }

    int value;
    if (!M_ParseInt(value_text, value)) {
      lprint(LO_WARN, "M_LoadDefaults: {}:{}: bad value \"{}\" for {}\n", filename, line, value_text, name);
      continue;
    }

    if (!M_InRange(*def, value)) {
      lprint(LO_WARN, "M_LoadDefaults: {}:{}: {} out of range for {}, using {}\n", filename, line, value, name,
             def->defaultvalue);
      value = def->defaultvalue;
    }

    *def->location = value;
  }

  return true;
}

//
// M_SaveDefaults
//
auto M_SaveDefaults(const char* const filename) -> bool {
  const auto f = std::unique_ptr<std::FILE, decltype(&std::fclose)>{std::fopen(filename, "w"), &std::fclose};
  if (f == nullptr) {
    lprintf(LO_WARN, "M_SaveDefaults: can't write %s: %s\n", filename, std::strerror(errno));
    return false;
  }

  print(f.get(), "# {} config file\n", PACKAGE_STRING);

  for (const auto& def : defaults) {
    if (def.type == def_none) {
      print(f.get(), "\n# {}\n", def.name);
    } else if (def.type == def_hex) {
      print(f.get(), "{:<25} {:#x}\n", def.name, *def.location);
    } else {
      print(f.get(), "{:<25} {}\n", def.name, *def.location);
    }
  }

  return true;
}
