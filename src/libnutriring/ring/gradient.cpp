// =====================================================================
//  src/libnutriring/ring/gradient.cpp — Highlight gradient ramp
// =====================================================================
//
//  Stop layout along the ring (0 = arc start, 1 = full circle):
//
//    0             start shade
//    hs * 0.65     start shade   (flat run)
//    hs            warm shade    (highlight peak)
//    he - 0.001    base shade
//    sweep+0.015   base shade    (holds the highlight past the tip)
//    0.999         start shade   (tail)
//    1             start shade
//
//  where he = sweep and hs = he minus the highlight band width.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/gradient.h>
#include <nutriring/ring/geometry.h>
#include <nutriring/color/color.h>

#include <QtMath>

#include <algorithm>
#include <cmath>

namespace nutriring {
namespace ring {

namespace {
    constexpr double kFlatRunFactor = 0.65;
    constexpr double kTipHold       = 0.015;
    constexpr double kTailPosition  = 0.999;
    constexpr double kPeakInset     = 0.001;
}

ShadeFactors shadeFactorsFor(bool isDarkSurface)
{
    if (isDarkSurface)
        return ShadeFactors{-0.35, 0.12, 0.12};
    return ShadeFactors{-0.18, 0.06, 0.08};
}

GradientStops deriveStops(const QColor& baseColor, double sweepFraction,
                          bool isDarkSurface)
{
    double sweep = std::isnan(sweepFraction)
        ? 0.0 : qBound(0.0, sweepFraction, kFullSweep);
    double intensity = effectIntensity(sweep);
    ShadeFactors f = shadeFactorsFor(isDarkSurface);

    QColor darkVariant  = color::adjustColor(baseColor, f.darken);
    QColor lightVariant = color::adjustColor(baseColor, f.lighten);

    QColor startShade = color::interpolateColor(baseColor, darkVariant, intensity);
    QColor warmShade  = color::interpolateColor(baseColor, lightVariant, intensity);

    double highlightEnd   = std::max(sweep, 0.0);
    double highlightStart = qBound(0.0, highlightEnd - f.bandWidth, highlightEnd);
    double flatRun        = highlightStart * kFlatRunFactor;
    // Near zero sweep the inset would fall below highlightStart.
    double peak           = std::max(highlightEnd - kPeakInset, highlightStart);
    double hold           = std::min(sweep + kTipHold, kTailPosition);

    GradientStops stops;
    stops.reserve(kStopCount);
    stops.append(GradientStop{0.0,           startShade});
    stops.append(GradientStop{flatRun,       startShade});
    stops.append(GradientStop{highlightStart, warmShade});
    stops.append(GradientStop{peak,          baseColor});
    stops.append(GradientStop{hold,          baseColor});
    stops.append(GradientStop{kTailPosition, startShade});
    stops.append(GradientStop{1.0,           startShade});
    return stops;
}

QColor colorAtOffset(double offset, const GradientStops& stops)
{
    if (stops.isEmpty())
        return QColor(255, 255, 255);

    if (std::isnan(offset) || offset <= stops.first().position)
        return stops.first().color;

    for (int i = 0; i + 1 < stops.size(); ++i) {
        const GradientStop& left  = stops[i];
        const GradientStop& right = stops[i + 1];
        if (offset >= left.position && offset <= right.position) {
            double span = std::max(right.position - left.position, kStopEpsilon);
            double t = (offset - left.position) / span;
            return color::interpolateColor(left.color, right.color, t);
        }
    }

    return stops.last().color;
}

bool stopsAreMonotonic(const GradientStops& stops)
{
    if (stops.isEmpty())
        return false;
    if (stops.first().position != 0.0 || stops.last().position != 1.0)
        return false;

    for (int i = 1; i < stops.size(); ++i) {
        if (stops[i].position < stops[i - 1].position)
            return false;
    }
    return true;
}

}  // namespace ring
}  // namespace nutriring
