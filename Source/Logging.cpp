#include "../Header/Logging.h"

// Per-frame debug output is noisy, keep it off unless QT_LOGGING_RULES asks for it
Q_LOGGING_CATEGORY(lcParams, "refractionvis.params")
Q_LOGGING_CATEGORY(lcWaveField, "refractionvis.wavefield", QtInfoMsg)
Q_LOGGING_CATEGORY(lcAnimation, "refractionvis.animation", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "refractionvis.config")
Q_LOGGING_CATEGORY(lcUi, "refractionvis.ui")
