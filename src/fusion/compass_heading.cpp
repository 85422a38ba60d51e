// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
#include "fusion/compass_heading.h"

#include <cmath>

namespace ds {

static constexpr float kPi = 3.14159265f;
static constexpr float kRadToDeg = 180.0f / kPi;

float compass_heading_deg(const discosense::hal::MagneticField& mag) {
    float heading = atan2f(mag.y, mag.x) * kRadToDeg;

    if (heading < 0.0f) {
        heading += 360.0f;
    }
    // -tiny + 360 rounds to 360 in float
    if (heading >= 360.0f) {
        heading = 0.0f;
    }
    return heading;
}

bool compass_heading_valid(const discosense::hal::MagneticField& mag) {
    return !(mag.x == 0.0f && mag.y == 0.0f);
}

} // namespace ds
