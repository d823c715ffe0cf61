// =====================================================================
//  src/libnutriring/settings.cpp — Ring configuration
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/settings.h>
#include <nutriring/logging.h>

#include <QSettings>

namespace nutriring {

ring::LayoutParams RingSettings::concentricLayout() const
{
    ring::LayoutParams p;
    p.center = QPointF(size / 2.0, size / 2.0);
    p.outerRadius = ring::outerRadiusFor(size, strokeWidth, padding);
    p.strokeWidth = strokeWidth;
    p.spacing = spacing;
    p.baseDelayMs = baseDelayMs;
    p.delayPerRingMs = delayPerRingMs;
    return p;
}

double RingSettings::dashboardRadius() const
{
    return ring::outerRadiusFor(size, strokeWidth, singleRingGap);
}

// ---- Overrides / theme choice ---------------------------------------

RingSettings applyOverrides(const RingSettings& stored,
                            const RingOverrides& overrides)
{
    RingSettings s = stored;
    if (overrides.dark) s.darkSurface = true;
    if (overrides.skipAnimation) s.skipAnimation = true;
    if (overrides.baseDelayMs >= 0) s.baseDelayMs = overrides.baseDelayMs;
    return s;
}

void saveThemeChoice(QSettings& store, bool dark)
{
    store.beginGroup(QStringLiteral("rings"));
    store.setValue(QStringLiteral("darkSurface"), dark);
    store.endGroup();
}

// ---- validateRingSettings -------------------------------------------

QStringList validateRingSettings(RingSettings& s)
{
    const RingSettings d;
    QStringList warnings;

    auto reject = [&warnings](const char* name) {
        warnings.append(QStringLiteral("%1 is out of range; using default")
                            .arg(QLatin1String(name)));
    };

    if (!(s.size > 0.0))          { reject("size");          s.size = d.size; }
    if (!(s.strokeWidth > 0.0))   { reject("strokeWidth");   s.strokeWidth = d.strokeWidth; }
    if (!(s.spacing >= 0.0))      { reject("spacing");       s.spacing = d.spacing; }
    if (!(s.padding >= 0.0))      { reject("padding");       s.padding = d.padding; }
    if (!(s.singleRingGap >= 0.0)) { reject("singleRingGap"); s.singleRingGap = d.singleRingGap; }
    if (s.baseDelayMs < 0)        { reject("baseDelayMs");   s.baseDelayMs = d.baseDelayMs; }
    if (s.delayPerRingMs < 0)     { reject("delayPerRingMs"); s.delayPerRingMs = d.delayPerRingMs; }
    if (s.frameIntervalMs <= 0)   { reject("frameIntervalMs"); s.frameIntervalMs = d.frameIntervalMs; }

    ring::ThrottleConfig& t = s.throttle;
    if (t.minFrameMs < 0 || t.maxFrameMs <= 0 || t.minFrameMs > t.maxFrameMs) {
        reject("minFrameMs/maxFrameMs");
        t.minFrameMs = d.throttle.minFrameMs;
        t.maxFrameMs = d.throttle.maxFrameMs;
    }
    if (!(t.minValueDelta >= 0.0)) { reject("minValueDelta"); t.minValueDelta = d.throttle.minValueDelta; }
    if (!(t.settleEpsilon >= 0.0)) { reject("settleEpsilon"); t.settleEpsilon = d.throttle.settleEpsilon; }

    ring::SpringConfig& sp = s.spring;
    if (!(sp.mass > 0.0))       { reject("springMass");      sp.mass = d.spring.mass; }
    if (!(sp.stiffness > 0.0))  { reject("springStiffness"); sp.stiffness = d.spring.stiffness; }
    if (!(sp.damping >= 0.0))   { reject("springDamping");   sp.damping = d.spring.damping; }

    return warnings;
}

// ---- load / save ----------------------------------------------------

SettingsLoadResult loadRingSettings(QSettings& store)
{
    const RingSettings d;
    SettingsLoadResult result;
    RingSettings& s = result.settings;

    store.beginGroup(QStringLiteral("rings"));

    s.size           = store.value(QStringLiteral("size"), d.size).toDouble();
    s.strokeWidth    = store.value(QStringLiteral("strokeWidth"), d.strokeWidth).toDouble();
    s.spacing        = store.value(QStringLiteral("spacing"), d.spacing).toDouble();
    s.padding        = store.value(QStringLiteral("padding"), d.padding).toDouble();
    s.singleRingGap  = store.value(QStringLiteral("singleRingGap"), d.singleRingGap).toDouble();
    s.baseDelayMs    = store.value(QStringLiteral("baseDelayMs"), d.baseDelayMs).toInt();
    s.delayPerRingMs = store.value(QStringLiteral("delayPerRingMs"), d.delayPerRingMs).toInt();
    s.darkSurface    = store.value(QStringLiteral("darkSurface"), d.darkSurface).toBool();
    s.skipAnimation  = store.value(QStringLiteral("skipAnimation"), d.skipAnimation).toBool();
    s.frameIntervalMs = store.value(QStringLiteral("frameIntervalMs"), d.frameIntervalMs).toInt();

    s.throttle.minFrameMs    = store.value(QStringLiteral("minFrameMs"), d.throttle.minFrameMs).toLongLong();
    s.throttle.maxFrameMs    = store.value(QStringLiteral("maxFrameMs"), d.throttle.maxFrameMs).toLongLong();
    s.throttle.minValueDelta = store.value(QStringLiteral("minValueDelta"), d.throttle.minValueDelta).toDouble();
    s.throttle.settleEpsilon = store.value(QStringLiteral("settleEpsilon"), d.throttle.settleEpsilon).toDouble();

    s.spring.mass      = store.value(QStringLiteral("springMass"), d.spring.mass).toDouble();
    s.spring.damping   = store.value(QStringLiteral("springDamping"), d.spring.damping).toDouble();
    s.spring.stiffness = store.value(QStringLiteral("springStiffness"), d.spring.stiffness).toDouble();

    store.endGroup();

    result.warnings = validateRingSettings(s);
    for (const QString& w : result.warnings)
        qCWarning(lcConfig) << w;

    return result;
}

void saveRingSettings(QSettings& store, const RingSettings& s)
{
    store.beginGroup(QStringLiteral("rings"));

    store.setValue(QStringLiteral("size"), s.size);
    store.setValue(QStringLiteral("strokeWidth"), s.strokeWidth);
    store.setValue(QStringLiteral("spacing"), s.spacing);
    store.setValue(QStringLiteral("padding"), s.padding);
    store.setValue(QStringLiteral("singleRingGap"), s.singleRingGap);
    store.setValue(QStringLiteral("baseDelayMs"), s.baseDelayMs);
    store.setValue(QStringLiteral("delayPerRingMs"), s.delayPerRingMs);
    store.setValue(QStringLiteral("darkSurface"), s.darkSurface);
    store.setValue(QStringLiteral("skipAnimation"), s.skipAnimation);
    store.setValue(QStringLiteral("frameIntervalMs"), s.frameIntervalMs);

    store.setValue(QStringLiteral("minFrameMs"), s.throttle.minFrameMs);
    store.setValue(QStringLiteral("maxFrameMs"), s.throttle.maxFrameMs);
    store.setValue(QStringLiteral("minValueDelta"), s.throttle.minValueDelta);
    store.setValue(QStringLiteral("settleEpsilon"), s.throttle.settleEpsilon);

    store.setValue(QStringLiteral("springMass"), s.spring.mass);
    store.setValue(QStringLiteral("springDamping"), s.spring.damping);
    store.setValue(QStringLiteral("springStiffness"), s.spring.stiffness);

    store.endGroup();
}

}  // namespace nutriring
