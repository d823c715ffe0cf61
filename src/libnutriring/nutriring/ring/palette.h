// =====================================================================
//  src/libnutriring/nutriring/ring/palette.h — Nutrient ring colors
// =====================================================================
//
//  Theme colors for the four nutrient rings and the helpers that turn
//  a nutrient key plus layout into RingParameters.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_PALETTE_H
#define NUTRIRING_RING_PALETTE_H

#include "types.h"

#include <QString>
#include <QStringList>

namespace nutriring {
namespace ring {

/// How a ring is presented.  The single dashboard ring has a softer
/// shadow, a translucent track and a tip badge; the concentric view
/// uses the theme's surface tints at full opacity.
enum class RingStyle {
    Dashboard,
    Concentric
};

/// Nutrient keys in display order: calories, protein, carbs, fat.
NUTRIRING_EXPORT const QStringList& nutrientKeys();

/// Base ring color for a nutrient.  Unknown keys use the calories color.
NUTRIRING_EXPORT QColor nutrientColor(const QString& key, bool dark);

/// Theme track tint for a nutrient (concentric view).
NUTRIRING_EXPORT QColor nutrientTrackColor(const QString& key, bool dark);

/// Shadow blob color for a style.
NUTRIRING_EXPORT QColor shadowColorFor(RingStyle style, bool dark);

/// Track opacity for a style.
NUTRIRING_EXPORT double trackOpacityFor(RingStyle style);

/// Neutral track used by the dashboard ring when no track is given.
NUTRIRING_EXPORT QColor dashboardTrackColor(const QColor& base, bool dark);

/// Background of the tip badge that rides the dashboard ring.
NUTRIRING_EXPORT QColor tipBadgeColor(const QColor& base, bool dark);

/// Build ring parameters for a nutrient.
NUTRIRING_EXPORT RingParameters ringParametersFor(const QString& key,
                                                  bool dark,
                                                  const QPointF& center,
                                                  double radius,
                                                  double strokeWidth,
                                                  RingStyle style);

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_PALETTE_H
