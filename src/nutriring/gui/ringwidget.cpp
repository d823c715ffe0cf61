// =====================================================================
//  src/nutriring/gui/ringwidget.cpp — Animated progress ring widget
// =====================================================================
//
//  Paint order per ring (ring coordinates, rotated so 0 rad is at
//  12 o'clock and then by the ring's overflow lap rotation):
//
//    track      full circle, track color and opacity
//    shadow     soft blob just ahead of the tip
//    arc        conical highlight gradient, round caps
//    tip cap    solid circle in the sampled tip color
//
//  The tip badge (dashboard style) is drawn last in widget coordinates
//  since its position already includes every rotation.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "ringwidget.h"

#include <nutriring/color/color.h>
#include <nutriring/ring/palette.h>
#include <nutriring/ring/tipmarker.h>

#include <QConicalGradient>
#include <QPainter>
#include <QPainterPath>
#include <QRadialGradient>
#include <QtMath>

namespace nutriring {

namespace {
    constexpr double kShadowRadiusFactor  = 0.75;  // of stroke width
    constexpr double kShadowBlurFactor    = 1.2;
    constexpr double kShadowOpacityFactor = 0.75;

    ring::LayoutParams layoutFor(const RingSettings& s, ring::RingStyle style)
    {
        if (style == ring::RingStyle::Concentric)
            return s.concentricLayout();

        ring::LayoutParams p = s.concentricLayout();
        p.outerRadius = s.dashboardRadius();
        return p;
    }

    ring::SpringConfig springFor(const RingSettings& s, ring::RingStyle style)
    {
        return style == ring::RingStyle::Dashboard ? s.spring
                                                   : ring::concentricSpring();
    }

    // Qt's conical gradient runs counter-clockwise; the ring sweeps
    // clockwise on screen, so mirror the ramp.
    QGradientStops mirroredStops(const ring::GradientStops& stops)
    {
        QGradientStops out;
        out.reserve(stops.size());
        for (int i = stops.size() - 1; i >= 0; --i)
            out.append(qMakePair(1.0 - stops[i].position, stops[i].color));
        return out;
    }
}

// ---- Constructor ----------------------------------------------------

RingWidget::RingWidget(const RingSettings& settings, ring::RingStyle style,
                       const QStringList& keys, QWidget* parent)
    : QWidget(parent)
    , m_settings(settings)
    , m_style(style)
    , m_rings(layoutFor(settings, style), settings.darkSurface, style,
              springFor(settings, style), settings.throttle)
{
    setObjectName(QStringLiteral("RingWidget"));
    setAttribute(Qt::WA_TransparentForMouseEvents, true);

    m_rings.setKeys(keys);
    m_rings.setSurface(this);

    m_clock.start();
    m_frameTimer.setInterval(m_settings.frameIntervalMs);
    connect(&m_frameTimer, &QTimer::timeout, this, [this]() { onFrame(); });
}

// ---- Targets --------------------------------------------------------

void RingWidget::setPercentages(const QMap<QString, double>& percentages)
{
    m_percentages = percentages;
    m_rings.setPercentages(percentages, m_settings.skipAnimation, now());
    if (!m_settings.skipAnimation)
        startFrames();
    update();
}

void RingWidget::syncInstantly()
{
    m_rings.setPercentages(m_percentages, true, now());
    update();
}

void RingWidget::setDark(bool dark)
{
    m_settings.darkSurface = dark;
    m_rings.setDark(dark);
    update();
}

void RingWidget::setCenterText(const QString& text)
{
    m_centerText = text;
    update();
}

// ---- RingSurface ----------------------------------------------------

void RingWidget::drawRing(const ring::RingParameters&,
                          const ring::RingVisualState&)
{
    update();
}

// ---- Frame loop -----------------------------------------------------

void RingWidget::startFrames()
{
    if (!m_frameTimer.isActive())
        m_frameTimer.start();
}

void RingWidget::onFrame()
{
    m_rings.tick(now());

    // The tip badge follows the driver every frame, not just on
    // accepted states.
    if (m_style == ring::RingStyle::Dashboard)
        update();

    if (m_rings.isIdle())
        m_frameTimer.stop();
}

// ---- Size hints -----------------------------------------------------

QSize RingWidget::sizeHint() const
{
    int s = qCeil(m_settings.size);
    return QSize(s, s);
}

QSize RingWidget::minimumSizeHint() const
{
    return sizeHint();
}

// ---- Painting -------------------------------------------------------

void RingWidget::paintEvent(QPaintEvent*)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    // Rings are laid out in a size x size box; center it in the widget.
    painter.translate((width() - m_settings.size) / 2.0,
                      (height() - m_settings.size) / 2.0);

    for (int i = 0; i < m_rings.count(); ++i)
        paintRing(painter, m_rings.ring(i));

    if (m_style != ring::RingStyle::Dashboard)
        return;

    for (int i = 0; i < m_rings.count(); ++i)
        paintTipBadge(painter, m_rings.ring(i));

    if (!m_centerText.isEmpty() && m_rings.count() > 0) {
        const ring::RingParameters& p = m_rings.ring(0).parameters();
        QFont f = font();
        f.setPointSizeF(f.pointSizeF() * 1.8);
        f.setBold(true);
        painter.setFont(f);
        painter.setPen(palette().color(QPalette::WindowText));
        QRectF box(p.center.x() - p.radius, p.center.y() - p.radius,
                   2.0 * p.radius, 2.0 * p.radius);
        painter.drawText(box, Qt::AlignCenter, m_centerText);
    }
}

void RingWidget::paintRing(QPainter& painter,
                           const ring::RingController& ring) const
{
    const ring::RingParameters& p = ring.parameters();
    const ring::RingVisualState& s = ring.visualState();

    QRectF circle(p.center.x() - p.radius, p.center.y() - p.radius,
                  2.0 * p.radius, 2.0 * p.radius);

    painter.save();
    painter.translate(p.center);
    painter.rotate(-90.0);
    painter.translate(-p.center);

    // ---- Track ----
    QPen trackPen(p.trackColor, p.strokeWidth, Qt::SolidLine, Qt::RoundCap);
    painter.setOpacity(p.trackOpacity);
    painter.setPen(trackPen);
    painter.setBrush(Qt::NoBrush);
    painter.drawEllipse(circle);

    painter.translate(p.center);
    painter.rotate(qRadiansToDegrees(s.lapRotation));
    painter.translate(-p.center);

    // ---- Shadow blob ----
    if (s.opacity > 0.0) {
        double r = p.strokeWidth * kShadowRadiusFactor;
        double blur = p.strokeWidth * kShadowBlurFactor;
        QRadialGradient shadow(s.shadowPoint, r + blur);
        shadow.setColorAt(0.0, p.shadowColor);
        shadow.setColorAt(r / (r + blur), color::withAlpha(p.shadowColor,
                              p.shadowColor.alphaF() * 0.5));
        shadow.setColorAt(1.0, color::withAlpha(p.shadowColor, 0.0));
        painter.setOpacity(s.opacity * kShadowOpacityFactor);
        painter.setPen(Qt::NoPen);
        painter.setBrush(shadow);
        painter.drawEllipse(s.shadowPoint, r + blur, r + blur);
    }

    // ---- Arc ----
    if (s.sweepFraction > 0.0) {
        QConicalGradient ramp(p.center, 0.0);
        ramp.setStops(mirroredStops(s.gradientStops));

        QPen arcPen(QBrush(ramp), p.strokeWidth, Qt::SolidLine, Qt::RoundCap);
        painter.setOpacity(1.0);
        painter.setPen(arcPen);
        painter.setBrush(Qt::NoBrush);
        // Negative span sweeps clockwise on screen.
        painter.drawArc(circle, 0, -qRound(s.sweepFraction * 360.0 * 16.0));
    }

    // ---- Tip cap ----
    if (s.opacity > 0.0) {
        painter.setOpacity(s.opacity);
        painter.setPen(Qt::NoPen);
        painter.setBrush(s.tipColor);
        painter.drawEllipse(s.endPoint, p.strokeWidth / 2.0, p.strokeWidth / 2.0);
    }

    painter.restore();
}

void RingWidget::paintTipBadge(QPainter& painter,
                               const ring::RingController& ring) const
{
    const ring::TipMarker& tip = ring.tipMarker();
    if (!tip.visible)
        return;

    const ring::RingParameters& p = ring.parameters();

    painter.save();
    painter.setPen(Qt::NoPen);
    painter.setBrush(ring::tipBadgeColor(p.baseColor, p.isDarkSurface));
    painter.drawEllipse(ring::tipBadgeRect(tip, p.strokeWidth));

    double icon = ring::tipIconSize(p.strokeWidth) / 2.0;
    painter.setBrush(p.baseColor);
    painter.drawEllipse(tip.position, icon * 0.6, icon * 0.6);
    painter.restore();
}

}  // namespace nutriring
