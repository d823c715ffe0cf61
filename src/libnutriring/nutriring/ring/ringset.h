// =====================================================================
//  src/libnutriring/nutriring/ring/ringset.h — Concentric ring group
// =====================================================================
//
//  A set of independent RingControllers laid out concentrically.  The
//  layout is recomputed only when the key list or layout parameters
//  change; each ring then animates on its own with the staggered
//  entrance delay its slot was given.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_RINGSET_H
#define NUTRIRING_RING_RINGSET_H

#include "controller.h"
#include "layout.h"
#include "palette.h"

#include <QMap>

#include <memory>
#include <vector>

namespace nutriring {
namespace ring {

class NUTRIRING_EXPORT RingSet {
public:
    RingSet(const LayoutParams& layout, bool dark, RingStyle style,
            const SpringConfig& spring = concentricSpring(),
            const ThrottleConfig& throttle = ThrottleConfig());

    /// Replace the ring keys (resolved through resolveRingKeys) and
    /// rebuild the rings.  Returns the layout result.
    LayoutResult setKeys(const QStringList& requested);

    /// Change layout parameters; rings are rebuilt only on change.
    LayoutResult setLayoutParams(const LayoutParams& layout);

    /// Switch theme; ring parameters are re-derived in place.
    void setDark(bool dark);

    /// Surface every ring draws on (not owned).
    void setSurface(RingSurface* surface);

    /// Targets as percentages of goal (100 = goal).  Missing keys are 0.
    void setPercentages(const QMap<QString, double>& percentages,
                        bool skipAnimation, qint64 nowMs);

    /// Advance every ring one frame.
    void tick(qint64 nowMs);

    /// True when every ring is idle.
    bool isIdle() const;

    int count() const { return static_cast<int>(m_rings.size()); }
    const RingController& ring(int index) const { return *m_rings[index]; }
    const QVector<RingSlot>& ringSlots() const { return m_layout.ringSlots; }
    const LayoutResult& layout() const { return m_layout; }

private:
    LayoutResult rebuild();
    RingParameters parametersFor(const RingSlot& slot) const;

    LayoutParams m_layoutParams;
    bool         m_dark;
    RingStyle    m_style;
    SpringConfig m_spring;
    ThrottleConfig m_throttle;
    RingSurface* m_surface = nullptr;

    QStringList  m_keys;
    LayoutResult m_layout;
    std::vector<std::unique_ptr<RingController>> m_rings;
};

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_RINGSET_H
