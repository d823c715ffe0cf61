// =====================================================================
//  src/libnutriring/ring/tipmarker.cpp — Arc tip marker
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/tipmarker.h>
#include <nutriring/ring/geometry.h>

namespace nutriring {
namespace ring {

namespace {
    constexpr double kIconFactor      = 0.65;
    constexpr double kSmallIconFactor = 0.55;
    constexpr double kBadgeFactor     = 1.3;   // badge / icon
}

TipMarker tipMarkerFor(double progress, const RingParameters& params,
                       double startAngle)
{
    double ratio = sanitizeRatio(progress);

    TipMarker m;
    m.angle = sweepFractionFor(ratio) * kTwoPi + startAngle + lapRotationFor(ratio);
    m.position = pointOnCircle(params.center, params.radius, m.angle);
    m.visible = ratio > kVisibilityThreshold;
    return m;
}

double tipBadgeSize(double strokeWidth)
{
    return strokeWidth * kIconFactor * kBadgeFactor;
}

double tipIconSize(double strokeWidth, bool small)
{
    return strokeWidth * (small ? kSmallIconFactor : kIconFactor);
}

QRectF tipBadgeRect(const TipMarker& marker, double strokeWidth)
{
    double size = tipBadgeSize(strokeWidth);
    return QRectF(marker.position.x() - size / 2.0,
                  marker.position.y() - size / 2.0,
                  size, size);
}

// ---- TipMarkerTracker -----------------------------------------------

TipMarkerTracker::TipMarkerTracker(const RingParameters& params,
                                   double startAngle)
    : m_params(params)
    , m_startAngle(startAngle)
    , m_marker(tipMarkerFor(0.0, params, startAngle))
{
}

void TipMarkerTracker::setParameters(const RingParameters& params)
{
    m_params = params;
    m_marker = tipMarkerFor(m_lastProgress, m_params, m_startAngle);
}

const TipMarker& TipMarkerTracker::update(double progress)
{
    m_lastProgress = progress;
    m_marker = tipMarkerFor(progress, m_params, m_startAngle);
    ++m_updateCount;
    return m_marker;
}

}  // namespace ring
}  // namespace nutriring
