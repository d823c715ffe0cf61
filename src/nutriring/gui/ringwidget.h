// =====================================================================
//  src/nutriring/gui/ringwidget.h — Animated progress ring widget
// =====================================================================
//
//  QPainter drawing surface for a RingSet.  A frame timer advances the
//  ring drivers; accepted visual states arrive through drawRing() and
//  schedule a repaint.  The dashboard style also draws the tip badge,
//  which follows the driver every frame.
//
//  The timer stops once every ring is idle and restarts when targets
//  change.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RINGWIDGET_H
#define NUTRIRING_RINGWIDGET_H

#include <nutriring/ring/ringset.h>
#include <nutriring/ring/surface.h>
#include <nutriring/settings.h>

#include <QElapsedTimer>
#include <QMap>
#include <QTimer>
#include <QWidget>

class QPainter;

namespace nutriring {

class RingWidget : public QWidget, public ring::RingSurface {
    Q_OBJECT

public:
    RingWidget(const RingSettings& settings, ring::RingStyle style,
               const QStringList& keys, QWidget* parent = nullptr);

    /// Set targets as percentages of goal, keyed by nutrient.
    void setPercentages(const QMap<QString, double>& percentages);

    /// Jump to the current targets without replaying the animation.
    void syncInstantly();

    /// Switch between dark and light surfaces.
    void setDark(bool dark);

    /// Label drawn in the ring center (dashboard style only).
    void setCenterText(const QString& text);

    void drawRing(const ring::RingParameters& params,
                  const ring::RingVisualState& state) override;

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    void onFrame();
    void startFrames();
    qint64 now() const { return m_clock.elapsed(); }

    void paintRing(QPainter& painter, const ring::RingController& ring) const;
    void paintTipBadge(QPainter& painter, const ring::RingController& ring) const;

    RingSettings    m_settings;
    ring::RingStyle m_style;
    ring::RingSet   m_rings;
    QMap<QString, double> m_percentages;
    QString         m_centerText;

    QTimer          m_frameTimer;
    QElapsedTimer   m_clock;
};

}  // namespace nutriring

#endif  // NUTRIRING_RINGWIDGET_H
