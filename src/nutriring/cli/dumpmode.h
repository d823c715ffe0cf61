// =====================================================================
//  src/nutriring/cli/dumpmode.h — Headless ring state dump
// =====================================================================
//
//  Runs the concentric ring pipeline against a simulated frame clock
//  and prints every state the throttle accepts.  Useful for checking
//  animation timing and gradient output without a display.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_DUMPMODE_H
#define NUTRIRING_DUMPMODE_H

#include <nutriring/ring/surface.h>
#include <nutriring/settings.h>

#include <QMap>
#include <QString>
#include <QStringList>

#include <iosfwd>

namespace nutriring {

class DumpMode : public ring::RingSurface {
public:
    explicit DumpMode(std::ostream& out);

    /// Animate the rings toward percentages and print accepted states.
    /// Stops when every ring is idle or after maxFrames frames.
    /// Returns 0 on success, 1 if the layout could not be built.
    int run(const RingSettings& settings,
            const QStringList& keys,
            const QMap<QString, double>& percentages,
            int maxFrames);

    void drawRing(const ring::RingParameters& params,
                  const ring::RingVisualState& state) override;

private:
    QString keyFor(const ring::RingParameters& params) const;

    std::ostream& m_out;
    qint64 m_nowMs = 0;
    QMap<double, QString> m_keysByRadius;
    int m_draws = 0;
};

}  // namespace nutriring

#endif  // NUTRIRING_DUMPMODE_H
