// =====================================================================
//  src/libnutriring/nutriring/ring/controller.h — Single-ring pipeline
// =====================================================================
//
//  Wires one ring's spring driver to its tip marker (every frame) and
//  to its redraw throttle (conditionally).  The owner calls tick() from
//  its frame timer; accepted states go to the attached RingSurface.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_CONTROLLER_H
#define NUTRIRING_RING_CONTROLLER_H

#include "driver.h"
#include "synchronizer.h"
#include "tipmarker.h"

namespace nutriring {
namespace ring {

class NUTRIRING_EXPORT RingController {
public:
    RingController(const RingParameters& params,
                   const SpringConfig& spring = SpringConfig(),
                   const ThrottleConfig& throttle = ThrottleConfig());

    /// Surface accepted states are drawn on (not owned).
    void setSurface(RingSurface* surface);

    void setParameters(const RingParameters& params);
    const RingParameters& parameters() const { return m_sync.parameters(); }

    /// Animate toward ratio after delayMs.  With skipAnimation the value
    /// is applied at once and published as a single state.
    void setTarget(double ratio, qint64 delayMs, bool skipAnimation,
                   qint64 nowMs);

    /// Show ratio immediately without replaying the entrance animation.
    void syncInstantly(double ratio, qint64 nowMs);

    /// Advance one display frame.
    PublishReason tick(qint64 nowMs);

    /// True when the driver is at rest and its final value is drawn.
    bool isIdle() const;

    double currentValue() const { return m_driver.value(); }
    double targetValue() const { return m_driver.target(); }
    const TipMarker& tipMarker() const { return m_tip.marker(); }
    const RingVisualState& visualState() const { return m_sync.currentState(); }
    const AnimationSynchronizer& synchronizer() const { return m_sync; }

private:
    SpringDriver          m_driver;
    AnimationSynchronizer m_sync;
    TipMarkerTracker      m_tip;
};

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_CONTROLLER_H
