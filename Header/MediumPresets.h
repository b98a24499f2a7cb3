#ifndef MEDIUMPRESETS_H
#define MEDIUMPRESETS_H

#include <QColor>
#include <QString>
#include <QVector>

#include "SimulationParameters.h"

struct Medium {
    QString name;
    double n;       // refractive index near 550 nm
    QColor color;   // translucent fill for the medium region
};

struct Scenario {
    QString name;
    QString medium1;
    QString medium2;
    QString medium3;
};

// Media currently shown in the three regions
struct MediumSelection {
    QString medium1{QStringLiteral("Air")};
    QString medium2{QStringLiteral("Water")};
    QString medium3{QStringLiteral("Glass (Crown)")};

    QString name(int slot) const;
    bool setName(int slot, const QString& medium);
};

const QVector<Medium>& mediumPresets();
const QVector<Scenario>& scenarioPresets();

// nullptr when the name is not a preset
const Medium* findMedium(const QString& name);
const Scenario* findScenario(const QString& name);

// Sets the refractive index of slot 1..3 from a preset
bool applyMedium(SimulationParameters& params, int slot, const QString& name);

// Applies all three media of a scenario, or nothing if any part is unknown
bool applyScenario(SimulationParameters& params, MediumSelection& selection,
                   const QString& scenarioName);

// e.g. "Air (n₁ = 1.0003)"
QString mediumLabel(const QString& name, int slot, double n);

#endif // MEDIUMPRESETS_H
