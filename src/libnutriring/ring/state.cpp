// =====================================================================
//  src/libnutriring/ring/state.cpp — Ring visual state reducer
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/state.h>
#include <nutriring/ring/geometry.h>
#include <nutriring/ring/gradient.h>

namespace nutriring {
namespace ring {

namespace {

// QPointF::operator== is fuzzy; redraw suppression needs exact equality.
bool samePoint(const QPointF& a, const QPointF& b)
{
    return a.x() == b.x() && a.y() == b.y();
}

}  // namespace

bool RingVisualState::operator==(const RingVisualState& other) const
{
    return sweepFraction == other.sweepFraction
        && lapRotation == other.lapRotation
        && samePoint(endPoint, other.endPoint)
        && samePoint(shadowPoint, other.shadowPoint)
        && opacity == other.opacity
        && tipColor == other.tipColor
        && gradientStops == other.gradientStops;
}

double opacityFor(double ratio)
{
    double r = sanitizeRatio(ratio);
    if (r <= kVisibilityThreshold)
        return 0.0;
    return effectIntensity(sweepFractionFor(r));
}

RingVisualState reduceRingState(double ratio, const RingParameters& params)
{
    double r = sanitizeRatio(ratio);
    RingGeometry g = computeGeometry(r, params.center, params.radius,
                                     params.strokeWidth);

    RingVisualState s;
    s.sweepFraction = g.sweepFraction;
    s.lapRotation   = g.lapRotation;
    s.endPoint      = g.endPoint;
    s.shadowPoint   = g.shadowPoint;
    s.opacity       = opacityFor(r);
    s.gradientStops = deriveStops(params.baseColor, g.sweepFraction,
                                  params.isDarkSurface);
    s.tipColor      = colorAtOffset(g.sweepFraction, s.gradientStops);
    return s;
}

}  // namespace ring
}  // namespace nutriring
