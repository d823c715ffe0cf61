// =====================================================================
//  src/libnutriring/ring/palette.cpp — Nutrient ring colors
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/palette.h>
#include <nutriring/color/color.h>

namespace nutriring {
namespace ring {

namespace {

struct NutrientTheme {
    const char* key;
    const char* lightBase;
    const char* darkBase;
    const char* lightTrack;
    const char* darkTrack;
};

// Light colors are deepened one step for readability on white.
constexpr NutrientTheme kThemes[] = {
    { "calories", "#1EC8B6", "#44EBD4", "rgba(68, 235, 212, 0.32)",  "#103833" },
    { "protein",  "#4F76FF", "#6A9BFF", "rgba(94, 135, 255, 0.32)",  "#19253D" },
    { "carbs",    "#FF5D5D", "#FF8A8A", "rgba(255, 109, 109, 0.16)", "#3D2121" },
    { "fat",      "#F5B72A", "#FFD740", "rgba(255, 194, 51, 0.18)",  "#3D340F" },
};

const NutrientTheme& themeFor(const QString& key)
{
    for (const NutrientTheme& t : kThemes) {
        if (key == QLatin1String(t.key))
            return t;
    }
    return kThemes[0];
}

}  // namespace

const QStringList& nutrientKeys()
{
    static const QStringList keys = {
        QStringLiteral("calories"),
        QStringLiteral("protein"),
        QStringLiteral("carbs"),
        QStringLiteral("fat"),
    };
    return keys;
}

QColor nutrientColor(const QString& key, bool dark)
{
    const NutrientTheme& t = themeFor(key);
    return color::colorOrBlack(QLatin1String(dark ? t.darkBase : t.lightBase));
}

QColor nutrientTrackColor(const QString& key, bool dark)
{
    const NutrientTheme& t = themeFor(key);
    return color::colorOrBlack(QLatin1String(dark ? t.darkTrack : t.lightTrack));
}

QColor shadowColorFor(RingStyle style, bool dark)
{
    if (dark)
        return color::withAlpha(QColor(0, 0, 0), 0.6);
    if (style == RingStyle::Dashboard)
        return color::withAlpha(QColor(0, 0, 0), 0.12);
    return color::withAlpha(QColor(0, 0, 0), 0.32);
}

double trackOpacityFor(RingStyle style)
{
    return style == RingStyle::Dashboard ? 0.75 : 1.0;
}

QColor dashboardTrackColor(const QColor& base, bool dark)
{
    if (dark)
        return color::adjustColor(base, -0.55);
    return color::withAlpha(QColor(17, 24, 39), 0.06);
}

QColor tipBadgeColor(const QColor& base, bool dark)
{
    if (dark)
        return dashboardTrackColor(base, dark);
    return color::adjustColor(base, 0.85);
}

RingParameters ringParametersFor(const QString& key, bool dark,
                                 const QPointF& center, double radius,
                                 double strokeWidth, RingStyle style)
{
    RingParameters p;
    p.center = center;
    p.radius = radius;
    p.strokeWidth = strokeWidth;
    p.baseColor = nutrientColor(key, dark);
    p.isDarkSurface = dark;
    p.trackColor = style == RingStyle::Dashboard
        ? dashboardTrackColor(p.baseColor, dark)
        : nutrientTrackColor(key, dark);
    p.trackOpacity = trackOpacityFor(style);
    p.shadowColor = shadowColorFor(style, dark);
    return p;
}

}  // namespace ring
}  // namespace nutriring
