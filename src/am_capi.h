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
 *  Every call takes plain numbers. A handle comes from AM_New and stays
 *  valid until AM_Free; passing NULL anywhere else is a fatal error, passing
 *  a freed or foreign handle is undefined. Map quantities are raw 16.16.
 *
 *-----------------------------------------------------------------------------*/

#ifndef __AM_CAPI__
#define __AM_CAPI__

#include <stdint.h>

#ifndef __cplusplus
#include <stdbool.h>
#endif  // __cplusplus

#include "support.h"

AMCORE_C_DECLS_BEGIN

typedef struct automap_handle_s automap_handle_t;

automap_handle_t* AM_New(int32_t player_x,
                         int32_t player_y,
                         int32_t window_width,
                         int32_t window_height,
                         int32_t scale_ftom);

void AM_Free(automap_handle_t* automap);

void AM_ChangeWindowLoc(automap_handle_t* automap,
                        bool rotate,
                        uint32_t map_angle,
                        int64_t min_x,
                        int64_t min_y,
                        int64_t max_x,
                        int64_t max_y);

void AM_ActivateNewScale(automap_handle_t* automap, int32_t window_width, int32_t window_height, int32_t scale_ftom);

/* A (0, 0) delta means no panning from that device. */
void AM_UpdatePanning(automap_handle_t* automap,
                      int64_t pan_keyboard_x,
                      int64_t pan_keyboard_y,
                      int64_t pan_mouse_x,
                      int64_t pan_mouse_y);

void AM_SaveRect(automap_handle_t* automap);
void AM_RestoreRect(automap_handle_t* automap, int32_t player_x, int32_t player_y);
void AM_FollowPlayer(automap_handle_t* automap, int32_t player_x, int32_t player_y);
void AM_SetFollow(automap_handle_t* automap, bool follow);
bool AM_IsFollowing(const automap_handle_t* automap);

void AM_GetRect(const automap_handle_t* automap, int64_t* x, int64_t* y, int64_t* width, int64_t* height);
void AM_PrintRect(const automap_handle_t* automap);

AMCORE_C_DECLS_END

#endif
