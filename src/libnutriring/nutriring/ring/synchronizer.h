// =====================================================================
//  src/libnutriring/nutriring/ring/synchronizer.h — Redraw throttle
// =====================================================================
//
//  Bridges a per-frame animation driver to the comparatively expensive
//  RingVisualState recompute.  Every sample either publishes (state is
//  recomputed and, if it differs from the rendered one, drawn) or is
//  suppressed.  A sample publishes when any of these holds:
//
//    settled   the driver moved less than settleEpsilon since the
//              previous sample
//    burst     the value moved at least minValueDelta since the last
//              publish and minFrameMs have passed
//    catch-up  maxFrameMs have passed since the last publish
//
//  The catch-up rule bounds how stale the drawn ring can be.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_SYNCHRONIZER_H
#define NUTRIRING_RING_SYNCHRONIZER_H

#include "types.h"

namespace nutriring {
namespace ring {

class RingSurface;

/// Throttle thresholds
struct ThrottleConfig {
    qint64 minFrameMs    = 16;     ///< Rate ceiling (~60 fps)
    qint64 maxFrameMs    = 48;     ///< Staleness floor (~20 fps)
    double minValueDelta = 0.004;  ///< Change that justifies a burst
    double settleEpsilon = 0.001;  ///< Per-sample change that counts as at rest
};

/// Why a sample was (or was not) published
enum class PublishReason {
    Suppressed,  ///< Held back by the throttle
    Reset,       ///< Forced by reset()
    Settled,
    Burst,
    CatchUp
};

NUTRIRING_EXPORT const char* publishReasonName(PublishReason reason);

class NUTRIRING_EXPORT AnimationSynchronizer {
public:
    enum class Phase {
        Idle,     ///< No sample or reset seen since construction
        Sampling  ///< Receiving driver samples
    };

    explicit AnimationSynchronizer(const RingParameters& params,
                                   const ThrottleConfig& config = ThrottleConfig());

    /// Attach the surface accepted states are drawn on (not owned).
    void setSurface(RingSurface* surface) { m_surface = surface; }

    /// Replace the ring parameters and re-derive the state from the
    /// last published value.  Draws only if the state changed.
    void setParameters(const RingParameters& params);

    const RingParameters& parameters() const { return m_params; }
    const ThrottleConfig& config() const { return m_config; }

    /// Process one driver sample.  Samples must arrive in time order.
    PublishReason onSample(const AnimationSample& sample);

    /// Publish value immediately and always draw it, discarding any
    /// throttle history.  The value becomes the previous sample for the
    /// settle check.  Used for skipped animations and instant sync.
    void reset(double value, qint64 nowMs);

    /// State currently on the surface.
    const RingVisualState& currentState() const { return m_state; }

    double lastPublishedValue() const { return m_lastPublishedValue; }
    qint64 lastPublishTime() const { return m_lastPublishTime; }
    Phase  phase() const { return m_phase; }

    /// Number of accepted publishes (including ones whose state was
    /// unchanged) and of actual surface draws.
    int publishCount() const { return m_publishCount; }
    int redrawCount() const { return m_redrawCount; }

private:
    PublishReason decide(double value, qint64 nowMs) const;
    void publish(double value, qint64 nowMs, bool forceDraw);
    void draw();

    RingParameters  m_params;
    ThrottleConfig  m_config;
    RingSurface*    m_surface = nullptr;

    RingVisualState m_state;
    Phase  m_phase = Phase::Idle;
    double m_previousValue = 0.0;
    double m_lastPublishedValue = 0.0;
    qint64 m_lastPublishTime = 0;
    int    m_publishCount = 0;
    int    m_redrawCount = 0;
};

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_SYNCHRONIZER_H
