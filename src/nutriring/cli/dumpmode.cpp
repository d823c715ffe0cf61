// =====================================================================
//  src/nutriring/cli/dumpmode.cpp — Headless ring state dump
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "dumpmode.h"

#include <nutriring/color/color.h>
#include <nutriring/ring/ringset.h>

#include <cstdio>
#include <ostream>

namespace nutriring {

DumpMode::DumpMode(std::ostream& out)
    : m_out(out)
{
}

int DumpMode::run(const RingSettings& settings,
                  const QStringList& keys,
                  const QMap<QString, double>& percentages,
                  int maxFrames)
{
    ring::RingSet rings(settings.concentricLayout(), settings.darkSurface,
                        ring::RingStyle::Concentric,
                        ring::concentricSpring(), settings.throttle);

    rings.setKeys(keys);

    const ring::LayoutResult& layout = rings.layout();
    if (!layout.success) {
        m_out << "Error: " << layout.errorMessage.toStdString() << std::endl;
        return 1;
    }

    for (const ring::RingSlot& slot : layout.ringSlots) {
        m_keysByRadius.insert(slot.radius, slot.key);
        char buf[96];
        std::snprintf(buf, sizeof(buf), "ring %-8s radius=%.1f delay=%dms",
                      slot.key.toUtf8().constData(), slot.radius,
                      slot.entranceDelayMs);
        m_out << buf << "\n";
    }
    for (const QString& dropped : layout.droppedKeys)
        m_out << "ring " << dropped.toStdString() << " dropped (no room)\n";

    rings.setSurface(this);
    m_nowMs = 0;
    rings.setPercentages(percentages, settings.skipAnimation, m_nowMs);

    int frames = 0;
    if (!settings.skipAnimation) {
        while (frames < maxFrames) {
            rings.tick(m_nowMs);
            ++frames;
            if (rings.isIdle()) break;
            m_nowMs += settings.frameIntervalMs;
        }
    }

    m_out << "frames=" << frames << " draws=" << m_draws << "\n";
    for (int i = 0; i < rings.count(); ++i) {
        const ring::AnimationSynchronizer& sync = rings.ring(i).synchronizer();
        m_out << "  " << layout.ringSlots[i].key.toStdString()
              << ": publishes=" << sync.publishCount()
              << " redraws=" << sync.redrawCount() << "\n";
    }
    m_out.flush();
    return 0;
}

void DumpMode::drawRing(const ring::RingParameters& params,
                        const ring::RingVisualState& state)
{
    ++m_draws;

    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "[%6lldms] %-8s sweep=%.4f laps=%.4f opacity=%.3f tip=%s",
                  static_cast<long long>(m_nowMs),
                  keyFor(params).toUtf8().constData(),
                  state.sweepFraction,
                  state.lapRotation / ring::kTwoPi,
                  state.opacity,
                  color::toHex(state.tipColor).toUtf8().constData());
    m_out << buf << "\n";
}

QString DumpMode::keyFor(const ring::RingParameters& params) const
{
    return m_keysByRadius.value(params.radius, QStringLiteral("?"));
}

}  // namespace nutriring
