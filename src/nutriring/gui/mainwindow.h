// =====================================================================
//  src/nutriring/gui/mainwindow.h — Ring preview window
// =====================================================================
//
//  Hosts the single dashboard ring and the concentric nutrient rings
//  side by side, with per-nutrient percentage inputs and a theme
//  toggle.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_MAINWINDOW_H
#define NUTRIRING_MAINWINDOW_H

#include <nutriring/settings.h>

#include <QMainWindow>
#include <QMap>

class QCheckBox;
class QDoubleSpinBox;

namespace nutriring {

class RingWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    MainWindow(const RingSettings& settings,
               const QStringList& keys,
               const QMap<QString, double>& percentages,
               QWidget* parent = nullptr);

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void applyPercentages();
    void onDarkToggled(bool dark);

    RingSettings m_settings;
    RingWidget*  m_dashboardRing = nullptr;
    RingWidget*  m_concentricRings = nullptr;
    QCheckBox*   m_darkCheck = nullptr;
    QMap<QString, QDoubleSpinBox*> m_inputs;
    bool         m_themeChosen = false;   ///< Dark toggle used this session
};

}  // namespace nutriring

#endif  // NUTRIRING_MAINWINDOW_H
