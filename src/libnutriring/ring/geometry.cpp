// =====================================================================
//  src/libnutriring/ring/geometry.cpp — Ratio to arc geometry
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/geometry.h>

#include <QtMath>

#include <algorithm>
#include <cmath>

namespace nutriring {
namespace ring {

double sanitizeRatio(double ratio)
{
    if (!std::isfinite(ratio) || ratio < 0.0)
        return 0.0;
    return ratio;
}

double sweepFractionFor(double ratio)
{
    double clamped = sanitizeRatio(ratio);
    double capped  = std::min(clamped, 1.0);
    return capped >= 1.0 ? kFullSweep : capped;
}

double lapRotationFor(double ratio)
{
    double clamped = sanitizeRatio(ratio);
    return std::max(clamped - 1.0, 0.0) * kTwoPi;
}

double effectIntensity(double sweepFraction)
{
    double t = (sweepFraction - kEffectStart) / kEffectRamp;
    if (std::isnan(t)) return 0.0;
    return qBound(0.0, t, 1.0);
}

QPointF pointOnCircle(const QPointF& center, double radius, double angle)
{
    return QPointF(center.x() + radius * std::cos(angle),
                   center.y() + radius * std::sin(angle));
}

RingGeometry computeGeometry(double ratio, const QPointF& center,
                             double radius, double strokeWidth)
{
    RingGeometry g;
    g.sweepFraction = sweepFractionFor(ratio);
    g.lapRotation   = lapRotationFor(ratio);

    double angle = g.sweepFraction * kTwoPi;
    g.endPoint = pointOnCircle(center, radius, angle);

    // Shadow sits ahead of the tip along the direction of travel.
    double tangent = angle + kPi / 2.0;
    double offset  = kShadowOffsetFactor * strokeWidth;
    g.shadowPoint = QPointF(g.endPoint.x() + std::cos(tangent) * offset,
                            g.endPoint.y() + std::sin(tangent) * offset);
    return g;
}

}  // namespace ring
}  // namespace nutriring
