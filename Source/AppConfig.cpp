#include "../Header/AppConfig.h"
#include "../Header/Logging.h"

#include <QFileInfo>
#include <QSettings>

namespace {

// Reads a number if present. Returns false when absent or unparsable.
bool readDouble(const QSettings& settings, const QString& key, double& out) {
    if (!settings.contains(key)) {
        return false;
    }
    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok) {
        qCWarning(lcConfig) << "ignoring" << key << "- not a number:"
                            << settings.value(key).toString();
        return false;
    }
    out = value;
    return true;
}

void loadWave(QSettings& settings, AppConfig& config) {
    settings.beginGroup(QStringLiteral("wave"));
    double value = 0.0;
    if (readDouble(settings, QStringLiteral("wavelength"), value)) {
        config.params.setWavelength(value);
    }
    if (readDouble(settings, QStringLiteral("amplitude"), value)) {
        config.params.setAmplitude(value);
    }
    if (readDouble(settings, QStringLiteral("speed"), value)) {
        config.params.setSpeed(value);
    }
    if (settings.contains(QStringLiteral("dispersion"))) {
        config.params.setDispersionEnabled(settings.value(QStringLiteral("dispersion")).toBool());
    }
    if (settings.contains(QStringLiteral("white_light"))) {
        config.params.setWhiteLightEnabled(settings.value(QStringLiteral("white_light")).toBool());
    }
    settings.endGroup();
}

void loadMedia(QSettings& settings, AppConfig& config) {
    settings.beginGroup(QStringLiteral("media"));
    for (int slot = 1; slot <= 3; ++slot) {
        const QString nameKey = QStringLiteral("medium%1").arg(slot);
        if (settings.contains(nameKey)) {
            const QString name = settings.value(nameKey).toString();
            if (applyMedium(config.params, slot, name)) {
                config.media.setName(slot, name);
            } else {
                qCWarning(lcConfig) << "ignoring" << nameKey << "=" << name;
            }
        }

        double n = 0.0;
        if (readDouble(settings, QStringLiteral("n%1").arg(slot), n)) {
            config.params.setRefractiveIndex(slot, n);
        }
    }
    settings.endGroup();
}

void loadGeometry(QSettings& settings, AppConfig& config) {
    settings.beginGroup(QStringLiteral("geometry"));
    double first = config.params.boundary1;
    double second = config.params.boundary2;
    const bool hasFirst = readDouble(settings, QStringLiteral("boundary1"), first);
    const bool hasSecond = readDouble(settings, QStringLiteral("boundary2"), second);
    if ((hasFirst || hasSecond) && !config.params.setBoundaries(first, second)) {
        qCWarning(lcConfig) << "keeping default boundaries"
                            << config.params.boundary1 << config.params.boundary2;
    }
    settings.endGroup();
}

void loadAnimation(QSettings& settings, AppConfig& config) {
    settings.beginGroup(QStringLiteral("animation"));
    const QString key = QStringLiteral("tick_interval_ms");
    if (settings.contains(key)) {
        bool ok = false;
        const int interval = settings.value(key).toInt(&ok);
        if (ok && interval >= kMinTickIntervalMs) {
            config.tickIntervalMs = interval;
        } else {
            qCWarning(lcConfig) << "ignoring" << key << "=" << settings.value(key).toString();
        }
    }
    settings.endGroup();
}

} // namespace

bool loadAppConfig(const QString& path, AppConfig& config) {
    config = AppConfig();

    if (!QFileInfo(path).isReadable()) {
        qCWarning(lcConfig) << "cannot read config" << path << "- using defaults";
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qCWarning(lcConfig) << "malformed config" << path << "- using defaults";
        return false;
    }

    loadWave(settings, config);
    loadMedia(settings, config);
    loadGeometry(settings, config);
    loadAnimation(settings, config);

    const ParameterError error = config.params.validate();
    if (error != ParameterError::None) {
        // Setters keep each field valid, so this only trips on a logic error
        qCWarning(lcConfig) << "config" << path << "is inconsistent:" << parameterErrorString(error);
        config = AppConfig();
    }

    qCInfo(lcConfig) << "loaded config" << path;
    return true;
}
