// =====================================================================
//  src/libnutriring/ring/controller.cpp — Single-ring pipeline
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/controller.h>

namespace nutriring {
namespace ring {

RingController::RingController(const RingParameters& params,
                               const SpringConfig& spring,
                               const ThrottleConfig& throttle)
    : m_driver(spring)
    , m_sync(params, throttle)
    , m_tip(params)
{
}

void RingController::setSurface(RingSurface* surface)
{
    m_sync.setSurface(surface);
}

void RingController::setParameters(const RingParameters& params)
{
    m_sync.setParameters(params);
    m_tip.setParameters(params);
}

void RingController::setTarget(double ratio, qint64 delayMs,
                               bool skipAnimation, qint64 nowMs)
{
    if (skipAnimation) {
        syncInstantly(ratio, nowMs);
        return;
    }
    m_driver.setTarget(ratio, delayMs, nowMs);
}

void RingController::syncInstantly(double ratio, qint64 nowMs)
{
    m_driver.jumpTo(ratio);
    m_tip.update(m_driver.value());
    m_sync.reset(m_driver.value(), nowMs);
}

PublishReason RingController::tick(qint64 nowMs)
{
    AnimationSample sample = m_driver.advanceTo(nowMs);
    m_tip.update(sample.value);
    return m_sync.onSample(sample);
}

bool RingController::isIdle() const
{
    return m_driver.isAtRest()
        && m_sync.lastPublishedValue() == m_driver.value();
}

}  // namespace ring
}  // namespace nutriring
