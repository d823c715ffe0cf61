// =====================================================================
//  src/libnutriring/nutriring/ring/tipmarker.h — Arc tip marker
// =====================================================================
//
//  Tracks the screen position of the small badge that rides the
//  leading edge of a ring.  Unlike the visual state this is updated on
//  every driver frame: it is plain trigonometry, and a throttled marker
//  visibly stutters against a smoothly moving arc.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_TIPMARKER_H
#define NUTRIRING_RING_TIPMARKER_H

#include "types.h"

#include <QRectF>

namespace nutriring {
namespace ring {

/// Angle at which rings start: 12 o'clock.
constexpr double kRingStartAngle = -kPi / 2.0;

/// Marker placement for one frame
struct TipMarker {
    QPointF position;        ///< Screen position of the marker center
    double  angle = 0.0;     ///< Final screen angle (radians)
    bool    visible = false; ///< Hidden at or below kVisibilityThreshold
};

/// Marker for a raw progress value.  The angle includes the ring start
/// rotation and any overflow lap rotation, matching the drawn arc.
NUTRIRING_EXPORT TipMarker tipMarkerFor(double progress,
                                        const RingParameters& params,
                                        double startAngle = kRingStartAngle);

/// Diameter of the round badge behind the marker icon.
NUTRIRING_EXPORT double tipBadgeSize(double strokeWidth);

/// Icon size inside the badge; small icons are drawn a little tighter.
NUTRIRING_EXPORT double tipIconSize(double strokeWidth, bool small = false);

/// Badge rectangle centered on the marker.
NUTRIRING_EXPORT QRectF tipBadgeRect(const TipMarker& marker, double strokeWidth);

class NUTRIRING_EXPORT TipMarkerTracker {
public:
    explicit TipMarkerTracker(const RingParameters& params,
                              double startAngle = kRingStartAngle);

    void setParameters(const RingParameters& params);

    /// Recompute the marker for this frame's raw driver value.
    const TipMarker& update(double progress);

    const TipMarker& marker() const { return m_marker; }
    int updateCount() const { return m_updateCount; }

private:
    RingParameters m_params;
    double    m_startAngle;
    double    m_lastProgress = 0.0;
    TipMarker m_marker;
    int       m_updateCount = 0;
};

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_TIPMARKER_H
