// =====================================================================
//  src/libnutriring/nutriring/ring/geometry.h — Ratio to arc geometry
// =====================================================================
//
//  Maps a progress ratio (1.0 = goal) to the partial-circle geometry
//  of a ring: how much of the circle to stroke, how many extra laps
//  to rotate by, and where the leading tip and its shadow sit.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_GEOMETRY_H
#define NUTRIRING_RING_GEOMETRY_H

#include "types.h"

namespace nutriring {
namespace ring {

/// Clamp a raw ratio to a finite non-negative value.
/// NaN, negative values and -inf become 0; +inf becomes 0 as well since
/// no finite lap count describes it.
NUTRIRING_EXPORT double sanitizeRatio(double ratio);

/// Sweep fraction for a ratio: the ratio itself below 1, kFullSweep at
/// or above 1.
NUTRIRING_EXPORT double sweepFractionFor(double ratio);

/// Extra whole-turn rotation (radians) for the part of the ratio
/// beyond the first lap.
NUTRIRING_EXPORT double lapRotationFor(double ratio);

/// Highlight strength for a sweep: 0 up to 10%, ramping to 1 at 40%.
NUTRIRING_EXPORT double effectIntensity(double sweepFraction);

/// Point on a circle at angle (radians, CW in screen space from +X).
NUTRIRING_EXPORT QPointF pointOnCircle(const QPointF& center, double radius,
                                       double angle);

/// Full arc geometry for a ratio.
///
/// @param ratio        Progress ratio (sanitized internally)
/// @param center       Ring center
/// @param radius       Ring radius (centerline of the stroke)
/// @param strokeWidth  Stroke width; sets the shadow offset
NUTRIRING_EXPORT RingGeometry computeGeometry(double ratio,
                                              const QPointF& center,
                                              double radius,
                                              double strokeWidth);

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_GEOMETRY_H
