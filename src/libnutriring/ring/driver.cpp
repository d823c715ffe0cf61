// =====================================================================
//  src/libnutriring/ring/driver.cpp — Spring animation driver
// =====================================================================
//
//  Semi-implicit Euler integration with a fixed 1 ms sub-step, which
//  stays stable for every spring the application configures regardless
//  of the frame interval.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/driver.h>
#include <nutriring/ring/geometry.h>

#include <algorithm>
#include <cmath>

namespace nutriring {
namespace ring {

namespace {
    constexpr double kSubStepSeconds = 0.001;
    constexpr double kRestVelocity   = 1e-3;   // units per second
    constexpr double kRestDistance   = 1e-4;
}

SpringConfig dashboardSpring()
{
    return SpringConfig{1.2, 25.0, 80.0};
}

SpringConfig concentricSpring()
{
    return SpringConfig{0.6, 15.0, 120.0};
}

// ---- Constructor ----------------------------------------------------

SpringDriver::SpringDriver(const SpringConfig& config)
    : m_config(config)
{
    if (!(m_config.mass > 0.0))
        m_config.mass = SpringConfig().mass;
}

// ---- Targeting ------------------------------------------------------

void SpringDriver::setTarget(double target, qint64 delayMs)
{
    m_target = sanitizeRatio(target);
    m_holdRemainingMs = std::max<qint64>(delayMs, 0);
}

void SpringDriver::setTarget(double target, qint64 delayMs, qint64 nowMs)
{
    if (m_hasTime && !isAtRest())
        advanceTo(nowMs);

    m_hasTime = true;
    m_lastTimeMs = nowMs;
    setTarget(target, delayMs);
}

void SpringDriver::jumpTo(double value)
{
    m_value = sanitizeRatio(value);
    m_target = m_value;
    m_velocity = 0.0;
    m_holdRemainingMs = 0;
}

// ---- advanceTo ------------------------------------------------------

AnimationSample SpringDriver::advanceTo(qint64 nowMs)
{
    if (!m_hasTime) {
        m_hasTime = true;
        m_lastTimeMs = nowMs;
        return AnimationSample{m_value, nowMs};
    }

    qint64 elapsed = std::max<qint64>(nowMs - m_lastTimeMs, 0);
    m_lastTimeMs = nowMs;

    // Hold consumes time before any easing happens.
    qint64 held = std::min(elapsed, m_holdRemainingMs);
    m_holdRemainingMs -= held;
    elapsed -= held;

    if (elapsed > 0 && !isAtRest())
        step(elapsed / 1000.0);

    return AnimationSample{m_value, nowMs};
}

bool SpringDriver::isAtRest() const
{
    return m_holdRemainingMs == 0
        && m_velocity == 0.0
        && m_value == m_target;
}

// ---- step -----------------------------------------------------------

void SpringDriver::step(double dtSeconds)
{
    double remaining = dtSeconds;
    while (remaining > 0.0) {
        double h = std::min(remaining, kSubStepSeconds);
        double force = -m_config.stiffness * (m_value - m_target)
                       - m_config.damping * m_velocity;
        m_velocity += (force / m_config.mass) * h;
        m_value += m_velocity * h;
        remaining -= h;
    }

    if (std::abs(m_velocity) < kRestVelocity &&
        std::abs(m_value - m_target) < kRestDistance) {
        m_value = m_target;
        m_velocity = 0.0;
    }
}

}  // namespace ring
}  // namespace nutriring
