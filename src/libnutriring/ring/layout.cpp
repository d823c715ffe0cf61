// =====================================================================
//  src/libnutriring/ring/layout.cpp — Concentric ring layout
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/layout.h>
#include <nutriring/ring/geometry.h>
#include <nutriring/ring/palette.h>
#include <nutriring/logging.h>

#include <cmath>

namespace nutriring {
namespace ring {

LayoutResult computeLayout(const QStringList& keys, const LayoutParams& params)
{
    LayoutResult result;

    double step = params.strokeWidth + params.spacing;
    if (!(step > 0.0)) {
        result.errorMessage = QStringLiteral(
            "Stroke width plus spacing must be positive (got %1)").arg(step);
        return result;
    }

    result.ringSlots.reserve(keys.size());

    for (int i = 0; i < keys.size(); ++i) {
        double radius = params.outerRadius - i * step;
        if (radius <= 0.0) {
            result.droppedKeys = keys.mid(i);
            qCWarning(lcLayout) << "no room for rings" << result.droppedKeys
                                << "inside outer radius" << params.outerRadius;
            break;
        }

        RingSlot slot;
        slot.key = keys[i];
        slot.center = params.center;
        slot.radius = radius;
        slot.entranceDelayMs = params.baseDelayMs + i * params.delayPerRingMs;
        result.ringSlots.append(slot);
    }

    result.success = true;
    return result;
}

double outerRadiusFor(double size, double strokeWidth, double padding)
{
    return size / 2.0 - strokeWidth / 2.0 - padding;
}

QStringList resolveRingKeys(const QStringList& requested)
{
    const QStringList& known = nutrientKeys();
    if (requested.isEmpty())
        return known;

    QStringList resolved;
    for (const QString& key : requested) {
        if (!known.contains(key)) {
            qCInfo(lcLayout) << "ignoring unknown ring key" << key;
            continue;
        }
        if (!resolved.contains(key))
            resolved.append(key);
    }
    return resolved;
}

double normalizePercentage(double percent)
{
    return sanitizeRatio(percent / 100.0);
}

std::optional<std::pair<QString, double>> parsePercentage(const QString& text)
{
    int eq = text.indexOf(QLatin1Char('='));
    if (eq <= 0)
        return std::nullopt;

    QString key = text.left(eq).trimmed().toLower();
    if (!nutrientKeys().contains(key))
        return std::nullopt;

    QString number = text.mid(eq + 1).trimmed();
    if (number.endsWith(QLatin1Char('%')))
        number.chop(1);

    bool ok = false;
    double value = number.toDouble(&ok);
    if (!ok || !std::isfinite(value) || value < 0.0)
        return std::nullopt;

    return std::make_pair(key, value);
}

}  // namespace ring
}  // namespace nutriring
