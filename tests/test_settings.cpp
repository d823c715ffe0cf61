// =====================================================================
//  tests/test_settings.cpp — Ring configuration
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/settings.h>

#include <QSettings>
#include <QTemporaryDir>
#include <QtTest>

using namespace nutriring;

class TestSettings : public QObject {
    Q_OBJECT

private slots:
    void init();
    void defaultsWhenEmpty();
    void savedValuesReload();
    void invalidValuesFallBack();
    void inconsistentThrottleResets();
    void derivedLayout();
    void overridesApplyOnTop();
    void overridesStayOutOfStore();
    void themeChoiceWritesOnlyTheme();

private:
    QString iniPath() const { return m_dir.filePath(QStringLiteral("rings.ini")); }

    QTemporaryDir m_dir;
};

void TestSettings::init()
{
    QFile::remove(iniPath());
}

void TestSettings::defaultsWhenEmpty()
{
    QSettings store(iniPath(), QSettings::IniFormat);
    SettingsLoadResult r = loadRingSettings(store);

    QVERIFY(r.warnings.isEmpty());
    QCOMPARE(r.settings.size, 176.0);
    QCOMPARE(r.settings.strokeWidth, 16.0);
    QCOMPARE(r.settings.delayPerRingMs, 120);
    QCOMPARE(r.settings.throttle.minFrameMs, qint64(16));
    QCOMPARE(r.settings.throttle.maxFrameMs, qint64(48));
    QCOMPARE(r.settings.spring.stiffness, 80.0);
    QVERIFY(!r.settings.darkSurface);
}

void TestSettings::savedValuesReload()
{
    RingSettings s;
    s.size = 240;
    s.darkSurface = true;
    s.baseDelayMs = 350;
    s.throttle.maxFrameMs = 64;
    s.spring.damping = 18.5;

    {
        QSettings store(iniPath(), QSettings::IniFormat);
        saveRingSettings(store, s);
    }

    QSettings store(iniPath(), QSettings::IniFormat);
    SettingsLoadResult r = loadRingSettings(store);

    QVERIFY(r.warnings.isEmpty());
    QCOMPARE(r.settings.size, 240.0);
    QVERIFY(r.settings.darkSurface);
    QCOMPARE(r.settings.baseDelayMs, 350);
    QCOMPARE(r.settings.throttle.maxFrameMs, qint64(64));
    QCOMPARE(r.settings.spring.damping, 18.5);
}

void TestSettings::invalidValuesFallBack()
{
    {
        QSettings store(iniPath(), QSettings::IniFormat);
        store.beginGroup(QStringLiteral("rings"));
        store.setValue(QStringLiteral("strokeWidth"), -3);
        store.setValue(QStringLiteral("springMass"), 0);
        store.setValue(QStringLiteral("delayPerRingMs"), -10);
        store.setValue(QStringLiteral("size"), QStringLiteral("large"));
        store.endGroup();
    }

    QSettings store(iniPath(), QSettings::IniFormat);
    SettingsLoadResult r = loadRingSettings(store);

    QCOMPARE(r.warnings.size(), 4);
    QCOMPARE(r.settings.strokeWidth, 16.0);
    QCOMPARE(r.settings.spring.mass, 1.2);
    QCOMPARE(r.settings.delayPerRingMs, 120);
    QCOMPARE(r.settings.size, 176.0);
}

void TestSettings::inconsistentThrottleResets()
{
    RingSettings s;
    s.throttle.minFrameMs = 60;
    s.throttle.maxFrameMs = 30;
    s.throttle.settleEpsilon = -1;

    QStringList warnings = validateRingSettings(s);
    QCOMPARE(warnings.size(), 2);
    QCOMPARE(s.throttle.minFrameMs, qint64(16));
    QCOMPARE(s.throttle.maxFrameMs, qint64(48));
    QCOMPARE(s.throttle.settleEpsilon, 0.001);

    RingSettings ok;
    QVERIFY(validateRingSettings(ok).isEmpty());
}

void TestSettings::derivedLayout()
{
    RingSettings s;
    ring::LayoutParams p = s.concentricLayout();

    QCOMPARE(p.center, QPointF(88, 88));
    QCOMPARE(p.outerRadius, 72.0);
    QCOMPARE(p.strokeWidth, 16.0);
    QCOMPARE(p.spacing, 8.0);
    QCOMPARE(p.delayPerRingMs, 120);
    QCOMPARE(s.dashboardRadius(), 76.0);
}

void TestSettings::overridesApplyOnTop()
{
    RingSettings stored;
    stored.baseDelayMs = 100;

    RingSettings s = applyOverrides(stored, RingOverrides());
    QVERIFY(!s.darkSurface);
    QVERIFY(!s.skipAnimation);
    QCOMPARE(s.baseDelayMs, 100);

    RingOverrides o;
    o.dark = true;
    o.skipAnimation = true;
    o.baseDelayMs = 0;
    s = applyOverrides(stored, o);
    QVERIFY(s.darkSurface);
    QVERIFY(s.skipAnimation);
    QCOMPARE(s.baseDelayMs, 0);
}

void TestSettings::overridesStayOutOfStore()
{
    {
        QSettings store(iniPath(), QSettings::IniFormat);
        RingSettings light;
        saveRingSettings(store, light);
    }

    // A run with --dark where the theme toggle is never touched.
    RingOverrides o;
    o.dark = true;
    o.baseDelayMs = 500;
    {
        QSettings store(iniPath(), QSettings::IniFormat);
        RingSettings running = applyOverrides(loadRingSettings(store).settings, o);
        QVERIFY(running.darkSurface);
    }

    QSettings store(iniPath(), QSettings::IniFormat);
    RingSettings reloaded = loadRingSettings(store).settings;
    QVERIFY(!reloaded.darkSurface);
    QCOMPARE(reloaded.baseDelayMs, 0);
}

void TestSettings::themeChoiceWritesOnlyTheme()
{
    {
        QSettings store(iniPath(), QSettings::IniFormat);
        store.beginGroup(QStringLiteral("rings"));
        store.setValue(QStringLiteral("size"), 200.0);
        store.endGroup();
    }

    // The run itself used --delay 500; only the toggled theme is written.
    RingOverrides o;
    o.baseDelayMs = 500;
    {
        QSettings store(iniPath(), QSettings::IniFormat);
        RingSettings running = applyOverrides(loadRingSettings(store).settings, o);
        running.darkSurface = true;
        saveThemeChoice(store, running.darkSurface);
    }

    QSettings store(iniPath(), QSettings::IniFormat);
    store.beginGroup(QStringLiteral("rings"));
    QCOMPARE(store.childKeys().size(), 2);
    QVERIFY(store.contains(QStringLiteral("darkSurface")));
    QVERIFY(!store.contains(QStringLiteral("baseDelayMs")));
    store.endGroup();

    RingSettings reloaded = loadRingSettings(store).settings;
    QVERIFY(reloaded.darkSurface);
    QCOMPARE(reloaded.size, 200.0);
    QCOMPARE(reloaded.baseDelayMs, 0);
}

QTEST_GUILESS_MAIN(TestSettings)
#include "test_settings.moc"
