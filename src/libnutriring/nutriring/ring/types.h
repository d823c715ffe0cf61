// =====================================================================
//  src/libnutriring/nutriring/ring/types.h — Ring value types
// =====================================================================
//
//  Lightweight value types shared by the ring pipeline: per-ring
//  configuration, gradient stops, the arc geometry and the immutable
//  visual snapshot handed to the drawing surface.
//
//  Angles are in radians, measured clockwise in screen space from the
//  +X axis (the drawing surface rotates the whole ring by -90° so the
//  arc starts at 12 o'clock).
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_TYPES_H
#define NUTRIRING_RING_TYPES_H

#include "../core.h"

#include <QColor>
#include <QPointF>
#include <QVector>

namespace nutriring {
namespace ring {

// =====================================================================
//  Constants
// =====================================================================

constexpr double kPi    = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

/// Sweep drawn at (and beyond) 100%.  Leaves a sliver so the round end
/// cap stays distinct from the start of the track.
constexpr double kFullSweep = 0.995;

/// Ratios at or below this are fully transparent.
constexpr double kVisibilityThreshold = 0.002;

/// Distance of the shadow blob from the arc tip, in stroke widths.
constexpr double kShadowOffsetFactor = 0.55;

/// Highlight switches on at 10% sweep and is at full strength by 40%.
constexpr double kEffectStart = 0.1;
constexpr double kEffectRamp  = 0.3;

// =====================================================================
//  Gradient Stops
// =====================================================================

/// A (position, color) pair on a 0..1 ramp
struct GradientStop {
    double position = 0.0;
    QColor color;

    bool operator==(const GradientStop& other) const
    {
        return position == other.position && color == other.color;
    }
    bool operator!=(const GradientStop& other) const { return !(*this == other); }
};

using GradientStops = QVector<GradientStop>;

// =====================================================================
//  Ring Configuration
// =====================================================================

/// Immutable per-ring configuration, passed by value
struct RingParameters {
    QPointF center;
    double  radius = 0.0;
    double  strokeWidth = 16.0;
    QColor  baseColor;
    bool    isDarkSurface = false;
    QColor  trackColor;
    double  trackOpacity = 1.0;
    QColor  shadowColor;

    bool operator==(const RingParameters& other) const
    {
        return center == other.center
            && radius == other.radius
            && strokeWidth == other.strokeWidth
            && baseColor == other.baseColor
            && isDarkSurface == other.isDarkSurface
            && trackColor == other.trackColor
            && trackOpacity == other.trackOpacity
            && shadowColor == other.shadowColor;
    }
    bool operator!=(const RingParameters& other) const { return !(*this == other); }
};

// =====================================================================
//  Geometry / Visual State
// =====================================================================

/// Arc geometry for one progress ratio
struct RingGeometry {
    double  sweepFraction = 0.0;  ///< [0, kFullSweep]
    double  lapRotation = 0.0;    ///< Extra rotation for overflow laps (radians)
    QPointF endPoint;             ///< Leading edge of the arc
    QPointF shadowPoint;          ///< Shadow blob center, ahead of the tip
};

/// Snapshot consumed by the drawing surface.  Replaced, never mutated.
struct NUTRIRING_EXPORT RingVisualState {
    double  sweepFraction = 0.0;
    double  lapRotation = 0.0;
    QPointF endPoint;
    QPointF shadowPoint;
    double  opacity = 0.0;
    QColor  tipColor;
    GradientStops gradientStops;

    /// Bit-exact comparison of every field, used to skip redundant redraws.
    bool operator==(const RingVisualState& other) const;
    bool operator!=(const RingVisualState& other) const { return !(*this == other); }
};

/// One raw driver value with its timestamp (monotonic milliseconds)
struct AnimationSample {
    double value = 0.0;
    qint64 timestampMs = 0;
};

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_TYPES_H
