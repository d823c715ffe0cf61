// =====================================================================
//  src/libnutriring/ring/ringset.cpp — Concentric ring group
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/ringset.h>
#include <nutriring/logging.h>

namespace nutriring {
namespace ring {

RingSet::RingSet(const LayoutParams& layout, bool dark, RingStyle style,
                 const SpringConfig& spring, const ThrottleConfig& throttle)
    : m_layoutParams(layout)
    , m_dark(dark)
    , m_style(style)
    , m_spring(spring)
    , m_throttle(throttle)
    , m_keys(resolveRingKeys(QStringList()))
{
    rebuild();
}

LayoutResult RingSet::setKeys(const QStringList& requested)
{
    QStringList keys = resolveRingKeys(requested);
    if (keys == m_keys && !m_rings.empty())
        return m_layout;

    m_keys = keys;
    return rebuild();
}

LayoutResult RingSet::setLayoutParams(const LayoutParams& layout)
{
    if (layout == m_layoutParams)
        return m_layout;

    m_layoutParams = layout;
    return rebuild();
}

void RingSet::setDark(bool dark)
{
    if (dark == m_dark) return;
    m_dark = dark;

    for (int i = 0; i < count(); ++i)
        m_rings[i]->setParameters(parametersFor(m_layout.ringSlots[i]));
}

void RingSet::setSurface(RingSurface* surface)
{
    m_surface = surface;
    for (auto& r : m_rings)
        r->setSurface(surface);
}

void RingSet::setPercentages(const QMap<QString, double>& percentages,
                             bool skipAnimation, qint64 nowMs)
{
    for (int i = 0; i < count(); ++i) {
        const RingSlot& slot = m_layout.ringSlots[i];
        double ratio = normalizePercentage(percentages.value(slot.key, 0.0));
        m_rings[i]->setTarget(ratio, slot.entranceDelayMs, skipAnimation, nowMs);
    }
}

void RingSet::tick(qint64 nowMs)
{
    for (auto& r : m_rings)
        r->tick(nowMs);
}

bool RingSet::isIdle() const
{
    for (const auto& r : m_rings) {
        if (!r->isIdle())
            return false;
    }
    return true;
}

// ---- rebuild --------------------------------------------------------

LayoutResult RingSet::rebuild()
{
    m_layout = computeLayout(m_keys, m_layoutParams);
    m_rings.clear();

    if (!m_layout.success) {
        qCWarning(lcLayout) << "ring layout failed:" << m_layout.errorMessage;
        return m_layout;
    }

    for (const RingSlot& slot : m_layout.ringSlots) {
        auto controller = std::make_unique<RingController>(
            parametersFor(slot), m_spring, m_throttle);
        controller->setSurface(m_surface);
        m_rings.push_back(std::move(controller));
    }

    qCDebug(lcLayout) << "laid out" << m_rings.size() << "rings";
    return m_layout;
}

RingParameters RingSet::parametersFor(const RingSlot& slot) const
{
    return ringParametersFor(slot.key, m_dark, slot.center, slot.radius,
                             m_layoutParams.strokeWidth, m_style);
}

}  // namespace ring
}  // namespace nutriring
