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
 *      Tests for the automap window: panning, clamping, rotation,
 *      rescaling, follow mode and save/restore.
 *
 *-----------------------------------------------------------------------------*/

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>

#include "am_map.h"
#include "test_support.h"

using namespace amcore;

namespace {
constexpr auto FX(const std::int64_t v) -> std::int64_t {
  return v * FRACUNIT;
}

constexpr auto player_at(const std::int32_t x, const std::int32_t y) -> player_point_t {
  return {x * FRACUNIT, y * FRACUNIT};
}

// wide enough never to clamp
const map_box_t open_level{{FX(-30000), FX(-30000)}, {FX(30000), FX(30000)}};

class AutomapTest : public ::testing::Test {
 protected:
  automap_t automap{player_at(1000, 1000), fb_size_t{320, 200}, frame_fixed_t::unit()};
};
}  // namespace

/* ========================================================================
 * Construction
 * ======================================================================== */

TEST_F(AutomapTest, OpensCenteredOnThePlayer) {
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(840), FX(900)}));
  EXPECT_EQ(automap.rect().size, (map_size_t{FX(320), FX(200)}));
}

TEST_F(AutomapTest, StartsFollowingWithNothingPending) {
  EXPECT_TRUE(automap.following());
  EXPECT_FALSE(automap.pan_keyboard().has_value());
  EXPECT_FALSE(automap.pan_mouse().has_value());
  EXPECT_EQ(automap.frame_zoom(), frame_fixed_t::unit());
  EXPECT_EQ(automap.map_zoom(), map_fixed_t::unit());
  EXPECT_EQ(automap.saved_rect(), automap.rect());
}

TEST(Automap, ScaleAppliesToWindowSize) {
  const automap_t am{player_at(0, 0), fb_size_t{320, 200}, frame_fixed_t::from_raw(FRACUNIT / 2)};
  EXPECT_EQ(am.rect().size, (map_size_t{FX(160), FX(100)}));
  EXPECT_EQ(am.rect().origin, (map_point_t{FX(-80), FX(-50)}));
}

/* ========================================================================
 * Panning
 * ======================================================================== */

TEST_F(AutomapTest, NoPendingPanIsANoop) {
  const auto before = automap.rect();
  automap.change_window_location(false, open_level, 0);
  EXPECT_EQ(automap.rect(), before);
  EXPECT_TRUE(automap.following());
}

TEST_F(AutomapTest, ZeroDeltasCountAsNoPan) {
  const auto before = automap.rect();
  automap.update_panning(map_vector_t{0, 0}, map_vector_t{0, 0});
  automap.change_window_location(false, open_level, 0);
  EXPECT_EQ(automap.rect(), before);
  EXPECT_TRUE(automap.following());
}

TEST_F(AutomapTest, KeyboardPanMovesWindowAndLeavesFollowMode) {
  automap.update_panning(map_vector_t{FX(8), 0}, std::nullopt);
  automap.change_window_location(false, open_level, 0);
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(848), FX(900)}));
  EXPECT_FALSE(automap.following());
}

TEST_F(AutomapTest, MouseDeltaIsConsumedKeyboardDeltaPersists) {
  automap.update_panning(map_vector_t{FX(8), 0}, map_vector_t{0, FX(-5)});
  automap.change_window_location(false, open_level, 0);
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(848), FX(895)}));
  EXPECT_FALSE(automap.pan_mouse().has_value());
  ASSERT_TRUE(automap.pan_keyboard().has_value());

  automap.change_window_location(false, open_level, 0);
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(856), FX(895)}));
}

TEST_F(AutomapTest, MouseOnlyPan) {
  automap.update_panning(std::nullopt, map_vector_t{FX(-10), FX(10)});
  automap.change_window_location(false, open_level, 0);
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(830), FX(910)}));

  automap.change_window_location(false, open_level, 0);
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(830), FX(910)}));
}

TEST_F(AutomapTest, FollowModeStaysOffUntilReenabled) {
  automap.update_panning(map_vector_t{FX(1), 0}, std::nullopt);
  automap.change_window_location(false, open_level, 0);
  automap.update_panning(std::nullopt, std::nullopt);
  automap.change_window_location(false, open_level, 0);
  EXPECT_FALSE(automap.following());

  automap.set_follow(true);
  EXPECT_TRUE(automap.following());
}

/* ========================================================================
 * Boundary clamping
 * ======================================================================== */

TEST_F(AutomapTest, PanInsideBoundariesIsNotClamped) {
  const map_box_t level{{FX(0), FX(0)}, {FX(2000), FX(2000)}};
  automap.update_panning(map_vector_t{FX(-3), FX(7)}, std::nullopt);
  automap.change_window_location(false, level, 0);
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(837), FX(907)}));
}

TEST_F(AutomapTest, CenterStopsAtTheMaxBoundary) {
  const map_box_t level{{FX(0), FX(0)}, {FX(1100), FX(2000)}};
  automap.update_panning(map_vector_t{FX(500), FX(1)}, std::nullopt);
  automap.change_window_location(false, level, 0);

  const auto& r = automap.rect();
  EXPECT_EQ(r.origin.x + r.size.width / 2, level.max.x);
  // the other axis is left alone
  EXPECT_EQ(r.origin.y, FX(901));
}

TEST_F(AutomapTest, CenterStopsAtTheMinBoundary) {
  const map_box_t level{{FX(900), FX(950)}, {FX(5000), FX(5000)}};
  automap.update_panning(map_vector_t{FX(-500), FX(-500)}, std::nullopt);
  automap.change_window_location(false, level, 0);

  const auto& r = automap.rect();
  EXPECT_EQ(r.origin.x + r.size.width / 2, level.min.x);
  EXPECT_EQ(r.origin.y + r.size.height / 2, level.min.y);
}

TEST_F(AutomapTest, CenterStopsAtTheMaxYBoundary) {
  const map_box_t level{{FX(0), FX(0)}, {FX(5000), FX(1010)}};
  automap.update_panning(std::nullopt, map_vector_t{0, FX(300)});
  automap.change_window_location(false, level, 0);

  const auto& r = automap.rect();
  EXPECT_EQ(r.origin.x, FX(840));
  EXPECT_EQ(r.origin.y + r.size.height / 2, level.max.y);
}

/* ========================================================================
 * Rotation
 * ======================================================================== */

TEST(AutomapRotate, AngleZeroIsIdentity) {
  for (const map_vector_t v : {map_vector_t{FX(3), FX(-7)}, map_vector_t{1, -1}, map_vector_t{FX(-32768), FX(32767)}}) {
    EXPECT_EQ(automap_t::rotate(v, 0), v);
  }
}

TEST(AutomapRotate, QuarterTurns) {
  EXPECT_EQ(automap_t::rotate({FX(3), FX(1)}, ANG90), (map_vector_t{FX(-1), FX(3)}));
  EXPECT_EQ(automap_t::rotate({FX(3), FX(1)}, ANG180), (map_vector_t{FX(-3), FX(-1)}));
  EXPECT_EQ(automap_t::rotate({FX(3), FX(1)}, ANG270), (map_vector_t{FX(1), FX(-3)}));
}

TEST(AutomapRotate, ComponentsMustFitSixteenSixteen) {
  const map_vector_t too_long{static_cast<std::int64_t>(std::numeric_limits<std::int32_t>::max()) + 1, 0};
  EXPECT_THROW(static_cast<void>(automap_t::rotate(too_long, ANG90)), fixed_overflow_error);
}

TEST_F(AutomapTest, RotatedPanFollowsTheMapAngle) {
  automap.update_panning(map_vector_t{FX(10), 0}, std::nullopt);
  automap.change_window_location(true, open_level, ANG90);
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(840), FX(910)}));
}

TEST_F(AutomapTest, RotationAtAngleZeroMatchesPlainPan) {
  automap_t plain = automap;
  automap.update_panning(map_vector_t{FX(12), FX(-4)}, map_vector_t{FX(1), FX(1)});
  plain.update_panning(map_vector_t{FX(12), FX(-4)}, map_vector_t{FX(1), FX(1)});

  automap.change_window_location(true, open_level, 0);
  plain.change_window_location(false, open_level, 0);
  EXPECT_EQ(automap.rect(), plain.rect());
}

TEST_F(AutomapTest, FailedRotationChangesNothing) {
  const auto before = automap.rect();
  const map_vector_t too_long{static_cast<std::int64_t>(std::numeric_limits<std::int32_t>::min()) - 1, 0};
  automap.update_panning(std::nullopt, too_long);

  EXPECT_THROW(automap.change_window_location(true, open_level, ANG45), fixed_overflow_error);
  EXPECT_EQ(automap.rect(), before);
  EXPECT_TRUE(automap.following());
  EXPECT_TRUE(automap.pan_mouse().has_value());
}

TEST_F(AutomapTest, PanDeltasThatCancelStillCountAsAPan) {
  const map_box_t level{{FX(0), FX(0)}, {FX(900), FX(5000)}};
  automap.update_panning(map_vector_t{FX(5), FX(-2)}, map_vector_t{FX(-5), FX(2)});
  automap.change_window_location(false, level, 0);

  // nothing moved, but the center was pulled back inside the level
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(740), FX(900)}));
  EXPECT_FALSE(automap.following());
  EXPECT_FALSE(automap.pan_mouse().has_value());
}

TEST_F(AutomapTest, SummedDeltasOutsideMapRangeThrow) {
  const auto before = automap.rect();
  automap.update_panning(map_vector_t{std::int64_t{1} << 62, 0}, map_vector_t{std::int64_t{1} << 62, 0});

  EXPECT_THROW(automap.change_window_location(false, open_level, 0), fixed_overflow_error);
  EXPECT_EQ(automap.rect(), before);
  EXPECT_TRUE(automap.following());
  EXPECT_TRUE(automap.pan_mouse().has_value());
}

TEST_F(AutomapTest, PanPastTheEndOfMapRangeThrows) {
  const auto before = automap.rect();
  automap.update_panning(map_vector_t{std::numeric_limits<std::int64_t>::max(), 0}, std::nullopt);

  EXPECT_THROW(automap.change_window_location(false, open_level, 0), fixed_overflow_error);
  EXPECT_EQ(automap.rect(), before);
  EXPECT_TRUE(automap.following());
}

TEST_F(AutomapTest, CenterPastTheEndOfMapRangeThrows) {
  const auto before = automap.rect();
  const auto room = std::numeric_limits<std::int64_t>::max() - before.origin.x;
  automap.update_panning(map_vector_t{room, 0}, std::nullopt);

  EXPECT_THROW(automap.change_window_location(false, open_level, 0), fixed_overflow_error);
  EXPECT_EQ(automap.rect(), before);
  EXPECT_TRUE(automap.following());
}

/* ========================================================================
 * Scale
 * ======================================================================== */

TEST_F(AutomapTest, NewScaleKeepsTheCenter) {
  automap.activate_new_scale(fb_size_t{320, 200}, frame_fixed_t::from_raw(FRACUNIT / 2));
  EXPECT_EQ(automap.rect().size, (map_size_t{FX(160), FX(100)}));
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(920), FX(950)}));

  automap.activate_new_scale(fb_size_t{640, 400}, frame_fixed_t::unit());
  EXPECT_EQ(automap.rect().size, (map_size_t{FX(640), FX(400)}));
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(680), FX(800)}));
}

TEST(AutomapKeyboardPan, ScrollSpeedInMapUnits) {
  const int saved = map_scroll_speed;
  map_scroll_speed = 8;

  const auto scale = frame_fixed_t::from_raw(2 * FRACUNIT);
  EXPECT_EQ(AM_KeyboardPan(scale, pan_direction_t::right), (map_vector_t{FX(16), 0}));
  EXPECT_EQ(AM_KeyboardPan(scale, pan_direction_t::left), (map_vector_t{FX(-16), 0}));
  EXPECT_EQ(AM_KeyboardPan(scale, pan_direction_t::up), (map_vector_t{0, FX(16)}));
  EXPECT_EQ(AM_KeyboardPan(scale, pan_direction_t::down), (map_vector_t{0, FX(-16)}));
  EXPECT_FALSE(AM_KeyboardPan(scale, pan_direction_t::none).has_value());

  map_scroll_speed = saved;
}

/* ========================================================================
 * Save / restore
 * ======================================================================== */

TEST_F(AutomapTest, RestoreBringsBackTheSavedWindow) {
  automap.update_panning(map_vector_t{FX(40), FX(-20)}, std::nullopt);
  automap.change_window_location(false, open_level, 0);
  ASSERT_FALSE(automap.following());

  automap.save_rect();
  const auto saved = automap.rect();

  automap.change_window_location(false, open_level, 0);
  automap.activate_new_scale(fb_size_t{320, 200}, frame_fixed_t::from_raw(3 * FRACUNIT));
  ASSERT_NE(automap.rect(), saved);

  automap.restore_rect(player_at(5, 5));
  EXPECT_EQ(automap.rect(), saved);
}

TEST_F(AutomapTest, SaveThenRestoreIsExact) {
  automap.set_follow(false);
  const auto before = automap.rect();
  automap.save_rect();
  automap.restore_rect(player_at(1000, 1000));
  EXPECT_EQ(automap.rect(), before);
}

TEST_F(AutomapTest, RestoreWhileFollowingRecentersOnThePlayer) {
  automap.save_rect();
  automap.activate_new_scale(fb_size_t{320, 200}, frame_fixed_t::from_raw(2 * FRACUNIT));

  automap.restore_rect(player_at(2000, -300));
  EXPECT_EQ(automap.rect().size, (map_size_t{FX(320), FX(200)}));
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(1840), FX(-400)}));
}

/* ========================================================================
 * Follow mode
 * ======================================================================== */

TEST_F(AutomapTest, FollowRecentersOnThePlayer) {
  automap.follow_player(player_at(1500, 500));
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(1340), FX(400)}));
}

TEST_F(AutomapTest, FollowSkipsAnUnchangedPosition) {
  log_capture_t log;

  automap.follow_player(player_at(1500, 500));
  automap.follow_player(player_at(1500, 500));
  EXPECT_EQ(log.count(LO_DEBUG, "AM_doFollowPlayer"), 1);

  automap.follow_player(player_at(1501, 500));
  EXPECT_EQ(log.count(LO_DEBUG, "AM_doFollowPlayer"), 2);
}

TEST_F(AutomapTest, FollowSkipLeavesTheWindowAlone) {
  automap.follow_player(player_at(100, 100));
  automap.save_rect();
  automap.follow_player(player_at(200, 200));

  // put the window somewhere else without touching the follow cache
  automap.set_follow(false);
  automap.restore_rect(player_at(0, 0));
  const auto elsewhere = automap.rect();
  ASSERT_EQ(elsewhere.origin, (map_point_t{FX(-60), FX(0)}));

  automap.follow_player(player_at(200, 200));
  EXPECT_EQ(automap.rect(), elsewhere);

  automap.follow_player(player_at(300, 300));
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(140), FX(200)}));
}

TEST_F(AutomapTest, PanningForgetsTheFollowedPosition) {
  automap.follow_player(player_at(1000, 1000));
  automap.update_panning(map_vector_t{FX(50), 0}, std::nullopt);
  automap.change_window_location(false, open_level, 0);
  ASSERT_EQ(automap.rect().origin.x, FX(890));

  automap.follow_player(player_at(1000, 1000));
  EXPECT_EQ(automap.rect().origin, (map_point_t{FX(840), FX(900)}));
}

TEST_F(AutomapTest, FollowPlayerDoesNotChangeTheFollowFlag) {
  automap.set_follow(false);
  automap.follow_player(player_at(7, 7));
  EXPECT_FALSE(automap.following());
}
