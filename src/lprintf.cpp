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
 *  Provides a logical console output routine that allows what is
 *  output to console normally and when output is redirected to
 *  be controlled..
 *
 *-----------------------------------------------------------------------------*/

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#include <array>
#include <format>
#include <string>

#include "lprintf.h"

int cons_error_mask = LO_WARN | LO_ERROR | LO_FATAL;      /* all errors to stderr */
int cons_output_mask = LO_INFO | LO_CONFIRM | LO_ALWAYS;  /* console output, no debug */

namespace {
constexpr std::size_t MAX_MESSAGE_SIZE = 2048;

output_sink_t output_sink = nullptr;
void* output_sink_user = nullptr;

// Wrapper to handle non-standard stdio implementations
auto doom_vsnprintf(char* const buf, const std::size_t max, const char* const fmt, va_list va) -> int {
  va_list vc;

  va_copy(vc, va);
  const int rv = std::vsnprintf(buf, max, fmt, vc);
  va_end(vc);

  if (rv < 0 && max != 0) {
    /* Need to be careful with a corrupt buffer */
    buf[max - 1] = '\0';
  }

  return rv;
}

auto L_Emit(const OutputLevels pri, const char* const msg) -> int {
  if (output_sink != nullptr) {
    output_sink(pri, msg, output_sink_user);
    if ((pri & LO_FATAL) != 0) {
      std::fputs(msg, stderr);
    }
    return static_cast<int>(std::char_traits<char>::length(msg));
  }

  if ((pri & cons_output_mask) != 0) {
    std::fputs(msg, stdout);
    std::fflush(stdout);
  }

  if ((pri & cons_error_mask) != 0) {
    std::fputs(msg, stderr);
  }

  return static_cast<int>(std::char_traits<char>::length(msg));
}
}  // namespace

void L_SetOutputSink(const output_sink_t sink, void* const user) {
  output_sink = sink;
  output_sink_user = user;
}

auto lprintf(const OutputLevels pri, const char* const s, ...) -> int {
  std::array<char, MAX_MESSAGE_SIZE> msg;

  va_list v;
  va_start(v, s);
  doom_vsnprintf(msg.data(), msg.size(), s, v);
  va_end(v);

  return L_Emit(pri, msg.data());
}

auto lvprint(const OutputLevels pri, const std::string_view fmt, const std::format_args args) -> int {
  const auto msg = std::vformat(fmt, args);
  return L_Emit(pri, msg.c_str());
}

auto vprint(std::FILE* const stream, const std::string_view fmt, const std::format_args args) -> int {
  const auto msg = std::vformat(fmt, args);
  return std::fputs(msg.c_str(), stream) < 0 ? -1 : static_cast<int>(msg.size());
}

/*
 * I_Error
 *
 * cphipps - put here, as I_Error is common to all the ports
 * Reports a fatal condition and leaves the process with status -1.
 */
void I_Error(const char* const error, ...) {
  std::array<char, MAX_MESSAGE_SIZE> errmsg;

  va_list argptr;
  va_start(argptr, error);
  doom_vsnprintf(errmsg.data(), errmsg.size(), error, argptr);
  va_end(argptr);

  lprintf(LO_FATAL, "%s\n", errmsg.data());
  std::exit(-1);
}

void I_Error_VFmt(const std::string_view fmt, const std::format_args args) {
  const auto errmsg = std::vformat(fmt, args);

  lprintf(LO_FATAL, "%s\n", errmsg.c_str());
  std::exit(-1);
}
