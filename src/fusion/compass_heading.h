// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 DiscoSense Project
#ifndef DISCOSENSE_FUSION_COMPASS_HEADING_H
#define DISCOSENSE_FUSION_COMPASS_HEADING_H

// Flat-board compass heading from the horizontal magnetic field.
// Pure C++, no Pico SDK dependencies.
//
// Heading = atan2(y, x) in degrees, folded into [0, 360).
// Exact only when the sensor Z axis is vertical. No roll/pitch
// compensation is applied; a tilted board gives a biased bearing.

#include "hal/SensorTypes.h"

namespace ds {

// Bearing in degrees, range [0, 360).
// For x == y == 0 (unpowered or saturated sensor) the angle is
// indeterminate; check compass_heading_valid() first.
float compass_heading_deg(const discosense::hal::MagneticField& mag);

// False when the horizontal components are both zero.
bool compass_heading_valid(const discosense::hal::MagneticField& mag);

} // namespace ds

#endif // DISCOSENSE_FUSION_COMPASS_HEADING_H
