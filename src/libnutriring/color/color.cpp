// =====================================================================
//  src/libnutriring/color/color.cpp — Color math helpers
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/color/color.h>
#include <nutriring/logging.h>

#include <QRegularExpression>
#include <QtMath>

#include <cmath>

namespace nutriring {
namespace color {

namespace {

int roundChannel(double v)
{
    return qBound(0, static_cast<int>(std::lround(v)), 255);
}

int blendChannel(int from, int to, double t)
{
    return roundChannel(from + (to - from) * t);
}

bool isHexDigits(const QString& hex)
{
    for (QChar c : hex) {
        char16_t u = c.unicode();
        bool digit = (u >= '0' && u <= '9')
                  || (u >= 'a' && u <= 'f')
                  || (u >= 'A' && u <= 'F');
        if (!digit)
            return false;
    }
    return !hex.isEmpty();
}

bool parseHexDigits(const QString& hex, int& r, int& g, int& b, int& a)
{
    // toUInt() would also take a "0x" prefix and padding.
    if (!isHexDigits(hex))
        return false;

    bool ok = false;
    uint value = hex.toUInt(&ok, 16);
    if (!ok) return false;

    switch (hex.size()) {
    case 3:
        r = ((value >> 8) & 0xF) * 17;
        g = ((value >> 4) & 0xF) * 17;
        b = (value & 0xF) * 17;
        a = 255;
        return true;
    case 6:
        r = (value >> 16) & 0xFF;
        g = (value >> 8) & 0xFF;
        b = value & 0xFF;
        a = 255;
        return true;
    case 8:
        r = (value >> 24) & 0xFF;
        g = (value >> 16) & 0xFF;
        b = (value >> 8) & 0xFF;
        a = value & 0xFF;
        return true;
    default:
        return false;
    }
}

}  // namespace

// =====================================================================
//  Parsing / Formatting
// =====================================================================

std::optional<QColor> parseColor(const QString& text)
{
    const QString s = text.trimmed();

    if (s.startsWith(QLatin1Char('#'))) {
        int r = 0, g = 0, b = 0, a = 255;
        if (!parseHexDigits(s.mid(1), r, g, b, a))
            return std::nullopt;
        return QColor(r, g, b, a);
    }

    static const QRegularExpression rgbRe(QStringLiteral(
        "^rgba?\\(\\s*(\\d{1,3})\\s*,\\s*(\\d{1,3})\\s*,\\s*(\\d{1,3})"
        "\\s*(?:,\\s*([0-9]*\\.?[0-9]+)\\s*)?\\)$"),
        QRegularExpression::CaseInsensitiveOption);

    QRegularExpressionMatch m = rgbRe.match(s);
    if (!m.hasMatch())
        return std::nullopt;

    int r = m.captured(1).toInt();
    int g = m.captured(2).toInt();
    int b = m.captured(3).toInt();
    if (r > 255 || g > 255 || b > 255)
        return std::nullopt;

    double alpha = 1.0;
    if (!m.captured(4).isEmpty()) {
        alpha = m.captured(4).toDouble();
        if (alpha > 1.0)
            return std::nullopt;
    }

    return QColor(r, g, b, roundChannel(alpha * 255.0));
}

QColor colorOrBlack(const QString& text)
{
    std::optional<QColor> c = parseColor(text);
    if (!c) {
        qCWarning(lcColor) << "unparseable color" << text;
        return QColor(0, 0, 0);
    }
    return *c;
}

QString toHex(const QColor& c)
{
    return QStringLiteral("#%1%2%3")
        .arg(c.red(),   2, 16, QLatin1Char('0'))
        .arg(c.green(), 2, 16, QLatin1Char('0'))
        .arg(c.blue(),  2, 16, QLatin1Char('0'));
}

QString toRgbaString(const QColor& c)
{
    return QStringLiteral("rgba(%1, %2, %3, %4)")
        .arg(c.red())
        .arg(c.green())
        .arg(c.blue())
        .arg(c.alphaF(), 0, 'g', 3);
}

// =====================================================================
//  Blending
// =====================================================================

QColor adjustColor(const QColor& c, double amount)
{
    double t = qBound(0.0, std::abs(amount), 1.0);
    int target = amount >= 0.0 ? 255 : 0;

    return QColor(blendChannel(c.red(),   target, t),
                  blendChannel(c.green(), target, t),
                  blendChannel(c.blue(),  target, t),
                  c.alpha());
}

QColor interpolateColor(const QColor& a, const QColor& b, double t)
{
    // NaN fails both comparisons in qBound; treat it as the start color.
    if (std::isnan(t)) t = 0.0;
    t = qBound(0.0, t, 1.0);

    return QColor(blendChannel(a.red(),   b.red(),   t),
                  blendChannel(a.green(), b.green(), t),
                  blendChannel(a.blue(),  b.blue(),  t),
                  blendChannel(a.alpha(), b.alpha(), t));
}

QColor withAlpha(const QColor& c, double alpha)
{
    QColor out(c.red(), c.green(), c.blue());
    out.setAlpha(roundChannel(qBound(0.0, alpha, 1.0) * 255.0));
    return out;
}

}  // namespace color
}  // namespace nutriring
