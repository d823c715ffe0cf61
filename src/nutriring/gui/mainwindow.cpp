// =====================================================================
//  src/nutriring/gui/mainwindow.cpp — Ring preview window
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "mainwindow.h"
#include "ringwidget.h"

#include <nutriring/core.h>
#include <nutriring/ring/palette.h>

#include <QCheckBox>
#include <QCloseEvent>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QPushButton>
#include <QSettings>
#include <QVBoxLayout>

namespace nutriring {

MainWindow::MainWindow(const RingSettings& settings,
                       const QStringList& keys,
                       const QMap<QString, double>& percentages,
                       QWidget* parent)
    : QMainWindow(parent)
    , m_settings(settings)
{
    setObjectName(QStringLiteral("MainWindow"));
    setWindowTitle(tr("NutriRing %1").arg(QString::fromLatin1(nutriring::version())));

    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);

    // ---- Rings ----
    auto* ringRow = new QHBoxLayout;
    m_dashboardRing = new RingWidget(m_settings, ring::RingStyle::Dashboard,
                                     QStringList{QStringLiteral("calories")},
                                     central);
    m_concentricRings = new RingWidget(m_settings, ring::RingStyle::Concentric,
                                       keys, central);
    ringRow->addWidget(m_dashboardRing);
    ringRow->addWidget(m_concentricRings);
    layout->addLayout(ringRow);

    // ---- Inputs ----
    auto* group = new QGroupBox(tr("Percent of goal"), central);
    auto* form = new QFormLayout(group);
    for (const QString& key : ring::nutrientKeys()) {
        auto* spin = new QDoubleSpinBox(group);
        spin->setRange(0.0, 500.0);
        spin->setDecimals(1);
        spin->setSuffix(QStringLiteral(" %"));
        spin->setValue(percentages.value(key, 0.0));
        connect(spin, qOverload<double>(&QDoubleSpinBox::valueChanged),
                this, [this]() { applyPercentages(); });
        form->addRow(key, spin);
        m_inputs.insert(key, spin);
    }
    layout->addWidget(group);

    auto* buttonRow = new QHBoxLayout;
    m_darkCheck = new QCheckBox(tr("Dark surface"), central);
    m_darkCheck->setChecked(m_settings.darkSurface);
    connect(m_darkCheck, &QCheckBox::toggled,
            this, [this](bool dark) { onDarkToggled(dark); });
    buttonRow->addWidget(m_darkCheck);

    auto* syncButton = new QPushButton(tr("Sync instantly"), central);
    connect(syncButton, &QPushButton::clicked, this, [this]() {
        m_dashboardRing->syncInstantly();
        m_concentricRings->syncInstantly();
    });
    buttonRow->addStretch();
    buttonRow->addWidget(syncButton);
    layout->addLayout(buttonRow);

    setCentralWidget(central);

    applyPercentages();
}

void MainWindow::applyPercentages()
{
    QMap<QString, double> values;
    for (auto it = m_inputs.constBegin(); it != m_inputs.constEnd(); ++it)
        values.insert(it.key(), it.value()->value());

    m_dashboardRing->setPercentages(values);
    m_dashboardRing->setCenterText(
        QStringLiteral("%1%").arg(qRound(values.value(QStringLiteral("calories")))));
    m_concentricRings->setPercentages(values);
}

void MainWindow::onDarkToggled(bool dark)
{
    m_settings.darkSurface = dark;
    m_themeChosen = true;
    m_dashboardRing->setDark(dark);
    m_concentricRings->setDark(dark);
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    // m_settings may carry command-line overrides; only a theme picked
    // in this window is stored.
    if (m_themeChosen) {
        QSettings s;
        saveThemeChoice(s, m_settings.darkSurface);
    }
    event->accept();
}

}  // namespace nutriring
