#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>

#include "AnimationDriver.h"
#include "MediumPresets.h"
#include "SimulationParameters.h"

// Start-up configuration. Every field starts at its built-in default.
struct AppConfig {
    SimulationParameters params;
    MediumSelection media;
    int tickIntervalMs{kDefaultTickIntervalMs};
};

// Reads an INI file written in the layout below. Missing keys keep their
// defaults; a group that breaks an invariant falls back to its defaults.
//
//   [wave]      wavelength, amplitude, speed, dispersion, white_light
//   [media]     medium1..3 (preset names), n1..n3 (override the preset index)
//   [geometry]  boundary1, boundary2
//   [animation] tick_interval_ms
//
// Returns false only when the file cannot be read; the defaults are returned
// in that case.
bool loadAppConfig(const QString& path, AppConfig& config);

#endif // APPCONFIG_H
