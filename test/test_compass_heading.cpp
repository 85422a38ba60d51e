// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
// Flat-board compass heading
//
// Heading = atan2(y, x) in degrees, folded into [0, 360).

#include <gtest/gtest.h>
#include "fusion/compass_heading.h"

#include <cmath>

using discosense::hal::MagneticField;
using ds::compass_heading_deg;
using ds::compass_heading_valid;

// ============================================================================
// Helpers
// ============================================================================

static constexpr float kTolDeg = 0.5f;

static MagneticField field(float x, float y, float z = 0.0f) {
    MagneticField m;
    m.x = x;
    m.y = y;
    m.z = z;
    return m;
}

// ============================================================================
// Cardinal Points
// ============================================================================

TEST(CompassHeading, CardinalPoints) {
    EXPECT_NEAR(compass_heading_deg(field(1.0f, 0.0f)), 0.0f, kTolDeg);
    EXPECT_NEAR(compass_heading_deg(field(0.0f, 1.0f)), 90.0f, kTolDeg);
    EXPECT_NEAR(compass_heading_deg(field(-1.0f, 0.0f)), 180.0f, kTolDeg);
    EXPECT_NEAR(compass_heading_deg(field(0.0f, -1.0f)), 270.0f, kTolDeg);
}

TEST(CompassHeading, Diagonals) {
    EXPECT_NEAR(compass_heading_deg(field(1.0f, 1.0f)), 45.0f, kTolDeg);
    EXPECT_NEAR(compass_heading_deg(field(-1.0f, 1.0f)), 135.0f, kTolDeg);
    EXPECT_NEAR(compass_heading_deg(field(-1.0f, -1.0f)), 225.0f, kTolDeg);
    EXPECT_NEAR(compass_heading_deg(field(1.0f, -1.0f)), 315.0f, kTolDeg);
}

// ============================================================================
// Range and Invariance
// ============================================================================

TEST(CompassHeading, AlwaysInHalfOpenRange) {
    for (int i = 0; i < 3600; i++) {
        const float a = static_cast<float>(i) * 0.1f * 3.14159265f / 180.0f;
        const float h = compass_heading_deg(field(cosf(a), sinf(a)));
        EXPECT_GE(h, 0.0f);
        EXPECT_LT(h, 360.0f);
    }
}

TEST(CompassHeading, TinyNegativeYFoldsBelow360) {
    // atan2 returns a tiny negative angle; +360 rounds to exactly 360 in float
    const float h = compass_heading_deg(field(1.0f, -1e-9f));
    EXPECT_GE(h, 0.0f);
    EXPECT_LT(h, 360.0f);
}

TEST(CompassHeading, IgnoresMagnitudeAndZ) {
    const float base = compass_heading_deg(field(0.3f, 0.2f));
    EXPECT_NEAR(compass_heading_deg(field(3.0f, 2.0f)), base, 1e-3f);
    EXPECT_NEAR(compass_heading_deg(field(0.3f, 0.2f, -0.9f)), base, 1e-3f);
}

// ============================================================================
// Validity
// ============================================================================

TEST(CompassHeading, ZeroHorizontalFieldIsInvalid) {
    EXPECT_FALSE(compass_heading_valid(field(0.0f, 0.0f)));
    EXPECT_FALSE(compass_heading_valid(field(0.0f, 0.0f, 0.5f)));

    // Still returns a number in range
    const float h = compass_heading_deg(field(0.0f, 0.0f));
    EXPECT_FALSE(std::isnan(h));
    EXPECT_GE(h, 0.0f);
    EXPECT_LT(h, 360.0f);
}

TEST(CompassHeading, NonZeroHorizontalFieldIsValid) {
    EXPECT_TRUE(compass_heading_valid(field(1e-4f, 0.0f)));
    EXPECT_TRUE(compass_heading_valid(field(0.0f, -0.2f)));
}
