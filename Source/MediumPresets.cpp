#include "../Header/MediumPresets.h"
#include "../Header/Logging.h"

QString MediumSelection::name(int slot) const {
    switch (slot) {
    case 1: return medium1;
    case 2: return medium2;
    case 3: return medium3;
    default: return QString();
    }
}

bool MediumSelection::setName(int slot, const QString& medium) {
    switch (slot) {
    case 1: medium1 = medium; return true;
    case 2: medium2 = medium; return true;
    case 3: medium3 = medium; return true;
    default: return false;
    }
}

const QVector<Medium>& mediumPresets() {
    static const QVector<Medium> presets = {
        {QStringLiteral("Air"), 1.0003, QColor(230, 230, 255, 50)},
        {QStringLiteral("Water"), 1.33, QColor(153, 204, 255, 80)},
        {QStringLiteral("Glass (Crown)"), 1.52, QColor(204, 230, 230, 100)},
        {QStringLiteral("Glass (Flint)"), 1.62, QColor(179, 204, 204, 100)},
        {QStringLiteral("Diamond"), 2.42, QColor(242, 242, 255, 130)},
        {QStringLiteral("Acrylic"), 1.49, QColor(230, 230, 179, 80)},
        {QStringLiteral("Glycerine"), 1.47, QColor(230, 204, 230, 80)},
        {QStringLiteral("Ethanol"), 1.36, QColor(204, 204, 230, 80)},
        {QStringLiteral("Quartz"), 1.54, QColor(255, 255, 230, 80)},
        {QStringLiteral("Sapphire"), 1.77, QColor(179, 179, 230, 100)},
    };
    return presets;
}

const QVector<Scenario>& scenarioPresets() {
    static const QVector<Scenario> scenarios = {
        {QStringLiteral("Air → Water → Glass"),
         QStringLiteral("Air"), QStringLiteral("Water"), QStringLiteral("Glass (Crown)")},
        {QStringLiteral("Air → Glass → Water"),
         QStringLiteral("Air"), QStringLiteral("Glass (Crown)"), QStringLiteral("Water")},
        {QStringLiteral("Water → Air → Glass"),
         QStringLiteral("Water"), QStringLiteral("Air"), QStringLiteral("Glass (Crown)")},
        {QStringLiteral("Air → Diamond → Glass"),
         QStringLiteral("Air"), QStringLiteral("Diamond"), QStringLiteral("Glass (Crown)")},
        {QStringLiteral("Glass → Air → Water"),
         QStringLiteral("Glass (Crown)"), QStringLiteral("Air"), QStringLiteral("Water")},
    };
    return scenarios;
}

const Medium* findMedium(const QString& name) {
    for (const Medium& medium : mediumPresets()) {
        if (medium.name == name) {
            return &medium;
        }
    }
    return nullptr;
}

const Scenario* findScenario(const QString& name) {
    for (const Scenario& scenario : scenarioPresets()) {
        if (scenario.name == name) {
            return &scenario;
        }
    }
    return nullptr;
}

bool applyMedium(SimulationParameters& params, int slot, const QString& name) {
    const Medium* medium = findMedium(name);
    if (!medium) {
        qCWarning(lcParams) << "unknown medium" << name;
        return false;
    }
    return params.setRefractiveIndex(slot, medium->n);
}

bool applyScenario(SimulationParameters& params, MediumSelection& selection,
                   const QString& scenarioName) {
    const Scenario* scenario = findScenario(scenarioName);
    if (!scenario) {
        qCWarning(lcParams) << "unknown scenario" << scenarioName;
        return false;
    }

    const Medium* m1 = findMedium(scenario->medium1);
    const Medium* m2 = findMedium(scenario->medium2);
    const Medium* m3 = findMedium(scenario->medium3);
    if (!m1 || !m2 || !m3) {
        qCWarning(lcParams) << "scenario" << scenarioName << "names an unknown medium";
        return false;
    }

    params.n1 = m1->n;
    params.n2 = m2->n;
    params.n3 = m3->n;
    selection.medium1 = m1->name;
    selection.medium2 = m2->name;
    selection.medium3 = m3->name;
    qCInfo(lcParams) << "applied scenario" << scenarioName;
    return true;
}

QString mediumLabel(const QString& name, int slot, double n) {
    static const QChar subscripts[] = {QChar(0x2081), QChar(0x2082), QChar(0x2083)};
    const QString index = (slot >= 1 && slot <= 3) ? QString(subscripts[slot - 1])
                                                   : QString::number(slot);
    return QStringLiteral("%1 (n%2 = %3)").arg(name, index, QString::number(n, 'f', 4));
}
