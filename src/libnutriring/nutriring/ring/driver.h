// =====================================================================
//  src/libnutriring/nutriring/ring/driver.h — Spring animation driver
// =====================================================================
//
//  A damped spring that eases a progress value toward its target, with
//  an optional hold before easing starts (staggered reveals).  The
//  driver is polled once per display frame and yields one
//  AnimationSample per poll.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_DRIVER_H
#define NUTRIRING_RING_DRIVER_H

#include "types.h"

namespace nutriring {
namespace ring {

/// Spring constants (SI-like: mass, damping c, stiffness k)
struct SpringConfig {
    double mass      = 1.2;
    double damping   = 25.0;
    double stiffness = 80.0;
};

/// Softer spring used by the single dashboard ring.
NUTRIRING_EXPORT SpringConfig dashboardSpring();

/// Quicker spring used by the concentric rings.
NUTRIRING_EXPORT SpringConfig concentricSpring();

class NUTRIRING_EXPORT SpringDriver {
public:
    explicit SpringDriver(const SpringConfig& config = SpringConfig());

    /// Ease toward target after holding for delayMs.  Velocity carries
    /// over so retargeting mid-flight stays smooth.
    void setTarget(double target, qint64 delayMs = 0);

    /// As above, with the hold measured from nowMs.  Motion still in
    /// flight is first advanced to nowMs against the old target.
    void setTarget(double target, qint64 delayMs, qint64 nowMs);

    /// Set the value instantly with no easing and no hold.
    void jumpTo(double value);

    /// Advance the simulation to nowMs (monotonic).  Without a time base
    /// from setTarget(..., nowMs) the first call only establishes it.
    AnimationSample advanceTo(qint64 nowMs);

    double value() const { return m_value; }
    double target() const { return m_target; }
    double velocity() const { return m_velocity; }
    bool isHolding() const { return m_holdRemainingMs > 0; }

    /// True once the value has reached the target and stopped.
    bool isAtRest() const;

private:
    void step(double dtSeconds);

    SpringConfig m_config;
    double m_value = 0.0;
    double m_velocity = 0.0;
    double m_target = 0.0;
    qint64 m_holdRemainingMs = 0;
    qint64 m_lastTimeMs = 0;
    bool   m_hasTime = false;
};

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_DRIVER_H
