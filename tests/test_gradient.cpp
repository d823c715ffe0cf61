// =====================================================================
//  tests/test_gradient.cpp — Gradient stops and ramp sampling
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/color/color.h>
#include <nutriring/ring/gradient.h>

#include <QtTest>

#include <cmath>
#include <limits>

using namespace nutriring;
using namespace nutriring::ring;

class TestGradient : public QObject {
    Q_OBJECT

private slots:
    void halfSweepOnLightSurface();
    void darkSurfaceWidensBand();
    void zeroSweepKeepsBaseColor();
    void stopsAlwaysMonotonic();
    void samplerBoundaries();
    void samplerInterpolates();
    void samplerHandlesCoincidentStops();
    void monotonicCheckRejectsBadRamps();
};

void TestGradient::halfSweepOnLightSurface()
{
    QColor base(30, 200, 182);
    GradientStops stops = deriveStops(base, 0.5, false);

    QCOMPARE(stops.size(), kStopCount);

    const double expected[] = {0.0, 0.273, 0.42, 0.499, 0.515, 0.999, 1.0};
    for (int i = 0; i < kStopCount; ++i)
        QVERIFY2(std::abs(stops[i].position - expected[i]) < 1e-9,
                 qPrintable(QStringLiteral("stop %1 at %2").arg(i).arg(stops[i].position)));

    // Full intensity at half sweep: the shades are the plain variants.
    QColor start = color::adjustColor(base, -0.18);
    QColor warm  = color::adjustColor(base, 0.06);

    QCOMPARE(stops[0].color, start);
    QCOMPARE(stops[1].color, start);
    QCOMPARE(stops[2].color, warm);
    QCOMPARE(stops[3].color, base);
    QCOMPARE(stops[4].color, base);
    QCOMPARE(stops[5].color, start);
    QCOMPARE(stops[6].color, start);
}

void TestGradient::darkSurfaceWidensBand()
{
    GradientStops stops = deriveStops(QColor(68, 235, 212), 0.5, true);
    QVERIFY(std::abs(stops[2].position - 0.38) < 1e-9);
    QCOMPARE(stops[0].color, color::adjustColor(QColor(68, 235, 212), -0.35));
}

void TestGradient::zeroSweepKeepsBaseColor()
{
    QColor base(79, 118, 255);
    GradientStops stops = deriveStops(base, 0.0, false);

    QVERIFY(stopsAreMonotonic(stops));
    for (const GradientStop& s : stops)
        QCOMPARE(s.color, base);

    QCOMPARE(stops[3].position, 0.0);
    QVERIFY(std::abs(stops[4].position - 0.015) < 1e-12);
}

void TestGradient::stopsAlwaysMonotonic()
{
    const QColor colors[] = {
        QColor(30, 200, 182), QColor(255, 93, 93), QColor(0, 0, 0), QColor(255, 255, 255)
    };
    const double extras[] = {
        -1.0, std::numeric_limits<double>::quiet_NaN(), 2.0, kFullSweep, 0.0005
    };

    for (const QColor& c : colors) {
        for (bool dark : {false, true}) {
            for (int i = 0; i <= 1000; ++i) {
                GradientStops stops = deriveStops(c, i / 1000.0, dark);
                QCOMPARE(stops.size(), kStopCount);
                QVERIFY2(stopsAreMonotonic(stops),
                         qPrintable(QStringLiteral("sweep %1").arg(i / 1000.0)));
            }
            for (double s : extras)
                QVERIFY(stopsAreMonotonic(deriveStops(c, s, dark)));
        }
    }
}

void TestGradient::samplerBoundaries()
{
    GradientStops stops = deriveStops(QColor(245, 183, 42), 0.6, false);

    QCOMPARE(colorAtOffset(0.0, stops), stops.first().color);
    QCOMPARE(colorAtOffset(-3.0, stops), stops.first().color);
    QCOMPARE(colorAtOffset(1.0, stops), stops.last().color);
    QCOMPARE(colorAtOffset(4.0, stops), stops.last().color);
    QCOMPARE(colorAtOffset(std::numeric_limits<double>::quiet_NaN(), stops),
             stops.first().color);

    QCOMPARE(colorAtOffset(0.5, GradientStops()), QColor(255, 255, 255));

    // Sampling at the tip lands in the base color hold.
    QCOMPARE(colorAtOffset(0.6, stops), QColor(245, 183, 42));
}

void TestGradient::samplerInterpolates()
{
    GradientStops stops;
    stops.append(GradientStop{0.0, QColor(0, 0, 0)});
    stops.append(GradientStop{1.0, QColor(255, 255, 255)});

    QCOMPARE(colorAtOffset(0.5, stops), QColor(128, 128, 128));
    QCOMPARE(colorAtOffset(0.5, stops), colorAtOffset(0.5, stops));
}

void TestGradient::samplerHandlesCoincidentStops()
{
    GradientStops stops;
    stops.append(GradientStop{0.0, QColor(0, 0, 0)});
    stops.append(GradientStop{0.5, QColor(255, 0, 0)});
    stops.append(GradientStop{0.5, QColor(0, 0, 255)});
    stops.append(GradientStop{1.0, QColor(0, 0, 255)});

    QColor c = colorAtOffset(0.5, stops);
    QVERIFY(c.isValid());
    QCOMPARE(c, QColor(255, 0, 0));
}

void TestGradient::monotonicCheckRejectsBadRamps()
{
    GradientStops stops;
    QVERIFY(!stopsAreMonotonic(stops));

    stops.append(GradientStop{0.0, Qt::black});
    stops.append(GradientStop{0.6, Qt::black});
    stops.append(GradientStop{0.4, Qt::black});
    stops.append(GradientStop{1.0, Qt::black});
    QVERIFY(!stopsAreMonotonic(stops));

    stops[2].position = 0.6;
    QVERIFY(stopsAreMonotonic(stops));

    stops.last().position = 0.9;
    QVERIFY(!stopsAreMonotonic(stops));
}

QTEST_APPLESS_MAIN(TestGradient)
#include "test_gradient.moc"
