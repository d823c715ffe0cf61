// =====================================================================
//  src/libnutriring/nutriring/settings.h — Ring configuration
// =====================================================================
//
//  Every tunable of the ring engine and its host views, persisted in
//  QSettings under the "rings" group.  Invalid stored values fall back
//  to their defaults and are reported as warnings.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_SETTINGS_H
#define NUTRIRING_SETTINGS_H

#include "core.h"
#include "ring/driver.h"
#include "ring/layout.h"
#include "ring/synchronizer.h"

#include <QStringList>

class QSettings;

namespace nutriring {

struct NUTRIRING_EXPORT RingSettings {
    double size = 176.0;
    double strokeWidth = 16.0;
    double spacing = 8.0;
    double padding = 8.0;          ///< Concentric view outer padding
    double singleRingGap = 4.0;    ///< Dashboard ring outer padding
    int    baseDelayMs = 0;
    int    delayPerRingMs = 120;
    bool   darkSurface = false;
    bool   skipAnimation = false;
    int    frameIntervalMs = 16;
    ring::ThrottleConfig throttle;
    ring::SpringConfig   spring;

    /// Layout for the concentric view centered in a size x size box.
    ring::LayoutParams concentricLayout() const;

    /// Radius of the single dashboard ring.
    double dashboardRadius() const;
};

/// Per-run overrides from the command line.  Applied on top of the
/// stored settings and never written back.
struct RingOverrides {
    bool dark = false;            ///< Force the dark surface
    bool skipAnimation = false;   ///< Force instant targets
    int  baseDelayMs = -1;        ///< Negative keeps the stored delay
};

/// Result of loadRingSettings()
struct SettingsLoadResult {
    RingSettings settings;
    QStringList  warnings;   ///< One entry per value replaced by its default
};

/// Read settings from the "rings" group.
NUTRIRING_EXPORT SettingsLoadResult loadRingSettings(QSettings& store);

/// Write settings to the "rings" group.
NUTRIRING_EXPORT void saveRingSettings(QSettings& store, const RingSettings& settings);

/// Stored settings with the run's overrides applied.
NUTRIRING_EXPORT RingSettings applyOverrides(const RingSettings& stored,
                                             const RingOverrides& overrides);

/// Persist the surface theme picked in the preview window.  Writes only
/// the darkSurface key of the "rings" group.
NUTRIRING_EXPORT void saveThemeChoice(QSettings& store, bool dark);

/// Check a settings value set; returns one warning per invalid field and
/// resets that field to its default.
NUTRIRING_EXPORT QStringList validateRingSettings(RingSettings& settings);

}  // namespace nutriring

#endif  // NUTRIRING_SETTINGS_H
