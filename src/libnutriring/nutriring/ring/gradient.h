// =====================================================================
//  src/libnutriring/nutriring/ring/gradient.h — Highlight gradient ramp
// =====================================================================
//
//  Builds the seven-stop angular gradient that makes a ring read as a
//  lit object (dark start, warm highlight just behind the tip), and
//  samples a color at any offset along such a ramp.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_GRADIENT_H
#define NUTRIRING_RING_GRADIENT_H

#include "types.h"

namespace nutriring {
namespace ring {

/// Number of stops deriveStops() always returns.
constexpr int kStopCount = 7;

/// Minimum interpolation span, guards equal-position stops.
constexpr double kStopEpsilon = 1e-4;

/// Tonal shift factors for the start/tail and highlight shades.
struct ShadeFactors {
    double darken;   ///< Negative, toward black
    double lighten;  ///< Positive, toward white
    double bandWidth;  ///< Highlight band width behind the tip
};

/// Shade factors for a surface; softer and narrower on light surfaces.
NUTRIRING_EXPORT ShadeFactors shadeFactorsFor(bool isDarkSurface);

/// Derive the ordered highlight stops for a sweep.
///
/// Positions are non-decreasing, the first is exactly 0 and the last
/// exactly 1.  The effect intensity is derived from the sweep.
///
/// @param baseColor      Ring color at rest
/// @param sweepFraction  Current sweep in [0, kFullSweep]
/// @param isDarkSurface  Whether the ring is drawn on a dark background
NUTRIRING_EXPORT GradientStops deriveStops(const QColor& baseColor,
                                           double sweepFraction,
                                           bool isDarkSurface);

/// Interpolated color at offset along stops.  Offsets before the first
/// stop return the first color, offsets past the last return the last.
/// An empty ramp yields white.
NUTRIRING_EXPORT QColor colorAtOffset(double offset, const GradientStops& stops);

/// Check the ramp contract: non-empty, starts at 0, ends at 1, and
/// positions never decrease.
NUTRIRING_EXPORT bool stopsAreMonotonic(const GradientStops& stops);

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_GRADIENT_H
