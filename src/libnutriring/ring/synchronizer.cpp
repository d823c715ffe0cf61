// =====================================================================
//  src/libnutriring/ring/synchronizer.cpp — Redraw throttle
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/synchronizer.h>
#include <nutriring/ring/geometry.h>
#include <nutriring/ring/state.h>
#include <nutriring/ring/surface.h>
#include <nutriring/logging.h>

#include <cmath>

namespace nutriring {
namespace ring {

const char* publishReasonName(PublishReason reason)
{
    switch (reason) {
    case PublishReason::Suppressed: return "suppressed";
    case PublishReason::Reset:      return "reset";
    case PublishReason::Settled:    return "settled";
    case PublishReason::Burst:      return "burst";
    case PublishReason::CatchUp:    return "catch-up";
    }
    return "unknown";
}

// ---- Constructor ----------------------------------------------------

AnimationSynchronizer::AnimationSynchronizer(const RingParameters& params,
                                             const ThrottleConfig& config)
    : m_params(params)
    , m_config(config)
    , m_state(reduceRingState(0.0, params))
{
}

// ---- setParameters --------------------------------------------------

void AnimationSynchronizer::setParameters(const RingParameters& params)
{
    m_params = params;

    RingVisualState next = reduceRingState(m_lastPublishedValue, m_params);
    if (next != m_state) {
        m_state = next;
        draw();
    }
}

// ---- onSample -------------------------------------------------------

PublishReason AnimationSynchronizer::onSample(const AnimationSample& sample)
{
    double value = sanitizeRatio(sample.value);

    PublishReason reason = decide(value, sample.timestampMs);

    m_previousValue = value;
    m_phase = Phase::Sampling;

    if (reason == PublishReason::Suppressed)
        return reason;

    qCDebug(lcSync) << "publish" << value << "at" << sample.timestampMs
                    << "ms:" << publishReasonName(reason);
    publish(value, sample.timestampMs, false);
    return reason;
}

// ---- reset ----------------------------------------------------------

void AnimationSynchronizer::reset(double value, qint64 nowMs)
{
    double v = sanitizeRatio(value);

    qCDebug(lcSync) << "reset to" << v << "at" << nowMs << "ms";

    m_phase = Phase::Sampling;
    m_previousValue = v;
    publish(v, nowMs, true);
}

// ---- decide ---------------------------------------------------------

PublishReason AnimationSynchronizer::decide(double value, qint64 nowMs) const
{
    // The first sample has no predecessor; treat it as its own previous
    // value, which reads as settled.
    double previous = m_phase == Phase::Idle ? value : m_previousValue;

    qint64 elapsed = nowMs - m_lastPublishTime;
    double delta   = std::abs(value - m_lastPublishedValue);

    if (std::abs(value - previous) < m_config.settleEpsilon)
        return PublishReason::Settled;
    if (delta >= m_config.minValueDelta && elapsed >= m_config.minFrameMs)
        return PublishReason::Burst;
    if (elapsed >= m_config.maxFrameMs)
        return PublishReason::CatchUp;

    return PublishReason::Suppressed;
}

// ---- publish / draw -------------------------------------------------

void AnimationSynchronizer::publish(double value, qint64 nowMs, bool forceDraw)
{
    m_lastPublishTime = nowMs;
    m_lastPublishedValue = value;
    ++m_publishCount;

    RingVisualState next = reduceRingState(value, m_params);
    if (!forceDraw && next == m_state)
        return;

    m_state = next;
    draw();
}

void AnimationSynchronizer::draw()
{
    ++m_redrawCount;
    if (m_surface)
        m_surface->drawRing(m_params, m_state);
}

}  // namespace ring
}  // namespace nutriring
