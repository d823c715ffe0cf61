// =====================================================================
//  src/nutriring/main.cpp — NutriRing startup dispatcher
// =====================================================================
//
//  Determines the startup mode:
//
//    1. --dump                    → headless state dump to stdout
//    2. No display server detected → headless state dump
//    3. Otherwise                  → ring preview window
//
//  Flags override stored settings for this run only:
//
//    --dark               dark surface
//    --skip-animation     jump straight to the targets
//    --delay <ms>         hold before the first ring eases
//    --frames <n>         frame limit for --dump (default 600)
//    --rings <a,b,...>    concentric ring keys, outermost first
//    <key>=<percent>      target, e.g. calories=62 protein=130
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/core.h>
#include <nutriring/ring/layout.h>
#include <nutriring/settings.h>

#include "cli/dumpmode.h"
#include "gui/mainwindow.h"

#include <QApplication>
#include <QCoreApplication>
#include <QMap>
#include <QSettings>

#include <cstdlib>
#include <iostream>

// ---- Helper: parse CLI flags -----------------------------------------

struct StartupFlags {
    bool dump = false;
    nutriring::RingOverrides overrides;
    int  frames = 600;
    QStringList ringKeys;
    QMap<QString, double> percentages;
    QStringList errors;
};

static StartupFlags parseFlags(int argc, char* argv[])
{
    StartupFlags flags;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == QLatin1String("--dump")) {
            flags.dump = true;
        }
        else if (arg == QLatin1String("--dark")) {
            flags.overrides.dark = true;
        }
        else if (arg == QLatin1String("--skip-animation")) {
            flags.overrides.skipAnimation = true;
        }
        else if (arg == QLatin1String("--delay") && i + 1 < argc) {
            bool ok = false;
            int ms = QString::fromLocal8Bit(argv[++i]).toInt(&ok);
            if (ok && ms >= 0)
                flags.overrides.baseDelayMs = ms;
            else
                flags.errors.append(QStringLiteral("invalid --delay value"));
        }
        else if (arg == QLatin1String("--frames") && i + 1 < argc) {
            bool ok = false;
            int n = QString::fromLocal8Bit(argv[++i]).toInt(&ok);
            if (ok && n > 0)
                flags.frames = n;
            else
                flags.errors.append(QStringLiteral("invalid --frames value"));
        }
        else if (arg == QLatin1String("--rings") && i + 1 < argc) {
            flags.ringKeys = QString::fromLocal8Bit(argv[++i])
                                 .split(QLatin1Char(','), Qt::SkipEmptyParts);
        }
        else if (auto pct = nutriring::ring::parsePercentage(arg)) {
            flags.percentages.insert(pct->first, pct->second);
        }
        else {
            flags.errors.append(QStringLiteral("unrecognized argument: %1").arg(arg));
        }
    }

    return flags;
}

// ---- Helper: detect display server -----------------------------------

static bool hasDisplayServer()
{
#if defined(Q_OS_LINUX) || defined(Q_OS_UNIX)
    const char* display  = std::getenv("DISPLAY");
    const char* wayland  = std::getenv("WAYLAND_DISPLAY");
    return (display && display[0] != '\0') ||
           (wayland && wayland[0] != '\0');
#else
    return true;
#endif
}

// ---- Helper: stored settings ---------------------------------------

static nutriring::RingSettings storedSettings()
{
    QSettings store;
    return nutriring::loadRingSettings(store).settings;
}

// ---- main ------------------------------------------------------------

int main(int argc, char* argv[])
{
    StartupFlags flags = parseFlags(argc, argv);
    if (!flags.errors.isEmpty()) {
        for (const QString& e : flags.errors)
            std::cerr << "Error: " << e.toStdString() << std::endl;
        return 2;
    }

    // Headless: no widgets, but QSettings still needs an application.
    if (flags.dump || !hasDisplayServer()) {
        if (!flags.dump) {
            std::cerr << "No display server detected (neither X11 nor Wayland)."
                      << std::endl
                      << "Dumping ring states instead." << std::endl;
        }

        QCoreApplication app(argc, argv);
        app.setApplicationName(QStringLiteral("NutriRing"));
        app.setOrganizationName(QStringLiteral("NutriRing"));

        nutriring::DumpMode dump(std::cout);
        return dump.run(
            nutriring::applyOverrides(storedSettings(), flags.overrides),
            flags.ringKeys, flags.percentages, flags.frames);
    }

    QApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("NutriRing"));
    app.setApplicationVersion(QString::fromLatin1(nutriring::version()));
    app.setOrganizationName(QStringLiteral("NutriRing"));

    nutriring::MainWindow window(
        nutriring::applyOverrides(storedSettings(), flags.overrides),
        flags.ringKeys, flags.percentages);
    window.show();
    return app.exec();
}
