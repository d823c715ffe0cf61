// =====================================================================
//  tests/test_tipmarker.cpp — Arc tip marker
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/palette.h>
#include <nutriring/ring/tipmarker.h>

#include <QtTest>

#include <cmath>

using namespace nutriring::ring;

namespace {

RingParameters fatRing(double radius = 72)
{
    return ringParametersFor(QStringLiteral("fat"), false, QPointF(88, 88),
                             radius, 16, RingStyle::Concentric);
}

bool nearPoint(const QPointF& a, const QPointF& b)
{
    return std::abs(a.x() - b.x()) < 1e-9 && std::abs(a.y() - b.y()) < 1e-9;
}

}  // namespace

class TestTipMarker : public QObject {
    Q_OBJECT

private slots:
    void startsAtTwelveOClock();
    void followsTheSweep();
    void overflowAddsLaps();
    void visibilityThreshold();
    void badgeSizing();
    void trackerCountsEveryUpdate();
    void trackerFollowsParameterChanges();
};

void TestTipMarker::startsAtTwelveOClock()
{
    TipMarker m = tipMarkerFor(0.0, fatRing());
    QCOMPARE(m.angle, kRingStartAngle);
    QVERIFY(nearPoint(m.position, QPointF(88, 16)));
    QVERIFY(!m.visible);
}

void TestTipMarker::followsTheSweep()
{
    TipMarker quarter = tipMarkerFor(0.25, fatRing());
    QVERIFY(std::abs(quarter.angle) < 1e-12);
    QVERIFY(nearPoint(quarter.position, QPointF(160, 88)));
    QVERIFY(quarter.visible);

    TipMarker half = tipMarkerFor(0.5, fatRing());
    QVERIFY(nearPoint(half.position, QPointF(88, 160)));

    // A custom start angle shifts the whole marker.
    TipMarker shifted = tipMarkerFor(0.25, fatRing(), 0.0);
    QVERIFY(nearPoint(shifted.position, QPointF(88, 160)));
}

void TestTipMarker::overflowAddsLaps()
{
    TipMarker m = tipMarkerFor(1.25, fatRing());
    double expected = kFullSweep * kTwoPi + kRingStartAngle + 0.25 * kTwoPi;
    QVERIFY(std::abs(m.angle - expected) < 1e-9);
    QVERIFY(nearPoint(m.position, QPointF(88 + 72 * std::cos(expected),
                                          88 + 72 * std::sin(expected))));
    QVERIFY(m.visible);
}

void TestTipMarker::visibilityThreshold()
{
    QVERIFY(!tipMarkerFor(kVisibilityThreshold, fatRing()).visible);
    QVERIFY(tipMarkerFor(0.003, fatRing()).visible);
    QVERIFY(!tipMarkerFor(-1.0, fatRing()).visible);
}

void TestTipMarker::badgeSizing()
{
    QVERIFY(std::abs(tipBadgeSize(16) - 13.52) < 1e-9);
    QVERIFY(std::abs(tipIconSize(16) - 10.4) < 1e-9);
    QVERIFY(std::abs(tipIconSize(16, true) - 8.8) < 1e-9);

    TipMarker m = tipMarkerFor(0.25, fatRing());
    QRectF rect = tipBadgeRect(m, 16);
    QVERIFY(nearPoint(rect.center(), m.position));
    QVERIFY(std::abs(rect.width() - 13.52) < 1e-9);
}

void TestTipMarker::trackerCountsEveryUpdate()
{
    TipMarkerTracker tracker(fatRing());
    QCOMPARE(tracker.updateCount(), 0);
    QVERIFY(!tracker.marker().visible);

    for (int i = 1; i <= 30; ++i)
        tracker.update(i / 100.0);

    QCOMPARE(tracker.updateCount(), 30);
    TipMarker expected = tipMarkerFor(0.30, fatRing());
    QVERIFY(nearPoint(tracker.marker().position, expected.position));

    // Same progress still counts as an update.
    tracker.update(0.30);
    QCOMPARE(tracker.updateCount(), 31);
}

void TestTipMarker::trackerFollowsParameterChanges()
{
    TipMarkerTracker tracker(fatRing());
    tracker.update(0.5);

    tracker.setParameters(fatRing(40));
    QVERIFY(nearPoint(tracker.marker().position, QPointF(88, 128)));
    QCOMPARE(tracker.updateCount(), 1);
}

QTEST_APPLESS_MAIN(TestTipMarker)
#include "test_tipmarker.moc"
