// =====================================================================
//  src/libnutriring/nutriring/ring/layout.h — Concentric ring layout
// =====================================================================
//
//  Packs N rings inward from a shared outer radius and assigns each a
//  staggered entrance delay.  Ring i has
//
//      radius_i = outerRadius - i * (strokeWidth + spacing)
//      delay_i  = baseDelay + i * delayPerRing
//
//  Rings whose radius would not be positive are dropped from the
//  result, innermost first, and reported in droppedKeys.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_LAYOUT_H
#define NUTRIRING_RING_LAYOUT_H

#include "types.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <utility>

namespace nutriring {
namespace ring {

/// Inputs of a multi-ring layout
struct LayoutParams {
    QPointF center;
    double  outerRadius = 0.0;
    double  strokeWidth = 16.0;
    double  spacing = 8.0;
    int     baseDelayMs = 0;
    int     delayPerRingMs = 120;

    bool operator==(const LayoutParams& other) const
    {
        return center == other.center
            && outerRadius == other.outerRadius
            && strokeWidth == other.strokeWidth
            && spacing == other.spacing
            && baseDelayMs == other.baseDelayMs
            && delayPerRingMs == other.delayPerRingMs;
    }
    bool operator!=(const LayoutParams& other) const { return !(*this == other); }
};

/// One placed ring, outer-to-inner
struct RingSlot {
    QString key;
    QPointF center;
    double  radius = 0.0;
    int     entranceDelayMs = 0;
};

/// Result of computeLayout()
struct LayoutResult {
    bool success = false;
    QString errorMessage;
    QVector<RingSlot> ringSlots;
    QStringList droppedKeys;   ///< Rings that did not fit
};

/// Lay out rings for keys (in order, outermost first).
/// Fails if strokeWidth + spacing is not positive.
NUTRIRING_EXPORT LayoutResult computeLayout(const QStringList& keys,
                                            const LayoutParams& params);

/// Outer ring radius that keeps a stroke inside a size x size box
/// with the given padding.
NUTRIRING_EXPORT double outerRadiusFor(double size, double strokeWidth,
                                       double padding);

/// Resolve requested nutrient keys: an empty request yields every
/// nutrient in display order; otherwise request order is kept and
/// duplicates and unknown keys are removed.
NUTRIRING_EXPORT QStringList resolveRingKeys(const QStringList& requested);

/// Percentage of goal (100 = goal) to a progress ratio, never negative.
NUTRIRING_EXPORT double normalizePercentage(double percent);

/// Parse "key=percent" (e.g. "protein=85.5").  The key must be a known
/// nutrient and the percentage a finite non-negative number.
NUTRIRING_EXPORT std::optional<std::pair<QString, double>>
parsePercentage(const QString& text);

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_LAYOUT_H
