// =====================================================================
//  src/libnutriring/nutriring/color/color.h — Color math helpers
// =====================================================================
//
//  Small pure helpers on QColor: parsing CSS-style color strings,
//  tonal adjustment toward white or black, and linear channel blending.
//  All results carry 8-bit integer channels so two colors derived from
//  the same inputs compare equal with QColor::operator==.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_COLOR_COLOR_H
#define NUTRIRING_COLOR_COLOR_H

#include "../core.h"

#include <QColor>
#include <QString>

#include <optional>

namespace nutriring {
namespace color {

/// Parse "#RGB", "#RRGGBB", "#RRGGBBAA", "rgb(r, g, b)" or
/// "rgba(r, g, b, a)" (a in 0..1).  Returns nullopt if unparseable.
NUTRIRING_EXPORT std::optional<QColor> parseColor(const QString& text);

/// Parse a color known to be valid at compile time (palette tables).
/// Unparseable input logs a warning and yields opaque black.
NUTRIRING_EXPORT QColor colorOrBlack(const QString& text);

/// Format as lower-case "#rrggbb" (alpha dropped).
NUTRIRING_EXPORT QString toHex(const QColor& c);

/// Format as "rgba(r, g, b, a)".
NUTRIRING_EXPORT QString toRgbaString(const QColor& c);

/// Shift a color toward white (amount > 0) or black (amount < 0).
/// |amount| is clamped to [0, 1]; alpha is preserved.
NUTRIRING_EXPORT QColor adjustColor(const QColor& c, double amount);

/// Per-channel linear blend from a to b.  t is clamped to [0, 1].
NUTRIRING_EXPORT QColor interpolateColor(const QColor& a, const QColor& b, double t);

/// Copy of c with alpha replaced (alpha in 0..1).
NUTRIRING_EXPORT QColor withAlpha(const QColor& c, double alpha);

}  // namespace color
}  // namespace nutriring

#endif  // NUTRIRING_COLOR_COLOR_H
