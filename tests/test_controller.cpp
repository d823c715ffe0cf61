// =====================================================================
//  tests/test_controller.cpp — Ring pipeline and concentric ring set
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/ring/controller.h>
#include <nutriring/ring/palette.h>
#include <nutriring/ring/ringset.h>
#include <nutriring/ring/state.h>
#include <nutriring/ring/surface.h>

#include <QtTest>

using namespace nutriring::ring;

namespace {

class CountingSurface : public RingSurface {
public:
    void drawRing(const RingParameters&,
                  const RingVisualState& state) override
    {
        ++draws;
        lastState = state;
    }

    int draws = 0;
    RingVisualState lastState;
};

RingParameters caloriesRing()
{
    return ringParametersFor(QStringLiteral("calories"), false,
                             QPointF(88, 88), 76, 16, RingStyle::Dashboard);
}

LayoutParams concentricParams()
{
    LayoutParams p;
    p.center = QPointF(88, 88);
    p.outerRadius = 80;
    return p;
}

}  // namespace

class TestController : public QObject {
    Q_OBJECT

private slots:
    void skipAnimationDrawsFinalState();
    void animationSettlesOnTarget();
    void tipTracksEveryFrame();
    void firstFrameAfterTargetMoves();
    void publishesAreNeverStale();
    void syncInstantlyInterruptsAnimation();
    void ringSetLaysOutAllNutrients();
    void ringSetStaggersEntrance();
    void ringSetRebuildsOnlyOnChange();
    void ringSetThemeSwitch();
};

void TestController::skipAnimationDrawsFinalState()
{
    CountingSurface surface;
    RingController c(caloriesRing(), dashboardSpring());
    c.setSurface(&surface);

    c.setTarget(0.62, 0, true, 0);

    QCOMPARE(c.currentValue(), 0.62);
    QCOMPARE(surface.draws, 1);
    QCOMPARE(surface.lastState, reduceRingState(0.62, caloriesRing()));
    QVERIFY(c.tipMarker().visible);
    QVERIFY(c.isIdle());
}

void TestController::animationSettlesOnTarget()
{
    CountingSurface surface;
    RingController c(caloriesRing(), dashboardSpring());
    c.setSurface(&surface);

    c.setTarget(0.8, 0, false, 0);
    QVERIFY(!c.isIdle());

    qint64 t = 0;
    for (; t <= 8000 && !c.isIdle(); t += 16)
        c.tick(t);

    QVERIFY(c.isIdle());
    QCOMPARE(c.currentValue(), 0.8);
    QCOMPARE(c.visualState(), reduceRingState(0.8, caloriesRing()));
    QCOMPARE(surface.lastState, c.visualState());
    QVERIFY(surface.draws > 1);
}

void TestController::firstFrameAfterTargetMoves()
{
    RingController c(caloriesRing(), concentricSpring());
    c.setTarget(0.5, 0, false, 1000);

    c.tick(1016);
    QVERIFY(c.currentValue() > 0.0);

    // Entrance delay counts from the target change.
    RingController delayed(caloriesRing(), concentricSpring());
    delayed.setTarget(0.5, 120, false, 1000);
    delayed.tick(1112);
    QCOMPARE(delayed.currentValue(), 0.0);
    delayed.tick(1128);
    QVERIFY(delayed.currentValue() > 0.0);
}

void TestController::tipTracksEveryFrame()
{
    RingController c(caloriesRing(), dashboardSpring());
    c.setTarget(0.5, 0, false, 0);

    int ticks = 0;
    for (qint64 t = 0; t <= 1000; t += 4) {
        c.tick(t);
        ++ticks;
    }

    // The marker follows the raw driver value on every frame while the
    // throttle drops most of the 4 ms frames.
    QCOMPARE(c.tipMarker().position, tipMarkerFor(c.currentValue(), caloriesRing()).position);
    QVERIFY(c.synchronizer().publishCount() < ticks);
}

void TestController::publishesAreNeverStale()
{
    RingController c(caloriesRing(), dashboardSpring());
    c.setTarget(1.4, 0, false, 0);

    for (qint64 t = 0; t <= 3000; t += 4) {
        c.tick(t);
        QVERIFY2(t - c.synchronizer().lastPublishTime() < 48,
                 qPrintable(QStringLiteral("stale at %1").arg(t)));
    }
}

void TestController::syncInstantlyInterruptsAnimation()
{
    CountingSurface surface;
    RingController c(caloriesRing(), dashboardSpring());
    c.setSurface(&surface);

    c.setTarget(0.9, 0, false, 0);
    c.tick(0);
    c.tick(100);
    QVERIFY(!c.isIdle());

    int before = surface.draws;
    c.syncInstantly(0.3, 116);

    QCOMPARE(surface.draws, before + 1);
    QCOMPARE(c.currentValue(), 0.3);
    QCOMPARE(c.targetValue(), 0.3);
    QCOMPARE(surface.lastState, reduceRingState(0.3, caloriesRing()));
    QVERIFY(c.isIdle());
}

void TestController::ringSetLaysOutAllNutrients()
{
    CountingSurface surface;
    RingSet set(concentricParams(), false, RingStyle::Concentric);
    set.setSurface(&surface);

    QCOMPARE(set.count(), 4);
    QCOMPARE(set.ringSlots().size(), 4);
    QCOMPARE(set.ring(0).parameters().radius, 80.0);
    QCOMPARE(set.ring(3).parameters().radius, 8.0);

    QMap<QString, double> pct;
    pct.insert(QStringLiteral("calories"), 50);
    pct.insert(QStringLiteral("fat"), 130);
    set.setPercentages(pct, true, 0);

    QCOMPARE(set.ring(0).currentValue(), 0.5);
    QCOMPARE(set.ring(1).currentValue(), 0.0);
    QCOMPARE(set.ring(3).currentValue(), 1.3);
    QCOMPARE(surface.draws, 4);
    QVERIFY(set.isIdle());
}

void TestController::ringSetStaggersEntrance()
{
    RingSet set(concentricParams(), false, RingStyle::Concentric);

    QMap<QString, double> pct;
    for (const QString& key : nutrientKeys())
        pct.insert(key, 80);
    set.setPercentages(pct, false, 0);

    for (qint64 t = 0; t <= 112; t += 16)
        set.tick(t);

    QVERIFY(set.ring(0).currentValue() > 0.0);
    QCOMPARE(set.ring(1).currentValue(), 0.0);
    QCOMPARE(set.ring(3).currentValue(), 0.0);

    qint64 t = 128;
    for (; t <= 10000 && !set.isIdle(); t += 16)
        set.tick(t);

    QVERIFY(set.isIdle());
    for (int i = 0; i < set.count(); ++i)
        QCOMPARE(set.ring(i).currentValue(), 0.8);
}

void TestController::ringSetRebuildsOnlyOnChange()
{
    RingSet set(concentricParams(), false, RingStyle::Concentric);

    QMap<QString, double> pct;
    pct.insert(QStringLiteral("calories"), 40);
    set.setPercentages(pct, true, 0);

    // Same keys: rings and their values survive.
    set.setKeys(nutrientKeys());
    QCOMPARE(set.ring(0).currentValue(), 0.4);

    LayoutResult r = set.setKeys(QStringList({QStringLiteral("protein"),
                                              QStringLiteral("fat")}));
    QVERIFY(r.success);
    QCOMPARE(set.count(), 2);
    QCOMPARE(set.ringSlots().at(1).key, QStringLiteral("fat"));
    QCOMPARE(set.ring(0).currentValue(), 0.0);

    LayoutParams tight = concentricParams();
    tight.outerRadius = 20;
    r = set.setLayoutParams(tight);
    QCOMPARE(set.count(), 1);
    QCOMPARE(r.droppedKeys, QStringList({QStringLiteral("fat")}));
}

void TestController::ringSetThemeSwitch()
{
    CountingSurface surface;
    RingSet set(concentricParams(), false, RingStyle::Concentric);
    set.setSurface(&surface);

    set.setDark(true);
    QVERIFY(set.ring(2).parameters().isDarkSurface);
    QCOMPARE(set.ring(2).parameters().baseColor,
             nutrientColor(QStringLiteral("carbs"), true));
    QCOMPARE(surface.draws, 4);

    set.setDark(true);
    QCOMPARE(surface.draws, 4);
}

QTEST_APPLESS_MAIN(TestController)
#include "test_controller.moc"
