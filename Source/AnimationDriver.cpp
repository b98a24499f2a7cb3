#include "../Header/AnimationDriver.h"
#include "../Header/ColorUtils.h"
#include "../Header/Logging.h"
#include "../Header/WaveField.h"

#include <algorithm>

AnimationDriver::AnimationDriver(SimulationParameters* params, QObject* parent)
    : QObject(parent), m_params(params), m_paused(false) {
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &AnimationDriver::tick);
}

void AnimationDriver::start(int intervalMs) {
    const int interval = std::max(kMinTickIntervalMs, intervalMs);
    if (interval != intervalMs) {
        qCWarning(lcAnimation) << "tick interval" << intervalMs << "ms raised to" << interval << "ms";
    }
    m_timer.start(interval);
    qCInfo(lcAnimation) << "animation started," << interval << "ms per tick";
}

void AnimationDriver::stop() {
    if (m_timer.isActive()) {
        m_timer.stop();
        qCInfo(lcAnimation) << "animation stopped at t =" << m_params->time;
    }
}

bool AnimationDriver::isRunning() const {
    return m_timer.isActive();
}

int AnimationDriver::interval() const {
    return m_timer.interval();
}

void AnimationDriver::setPaused(bool paused) {
    if (m_paused != paused) {
        qCInfo(lcAnimation) << (paused ? "paused" : "resumed");
    }
    m_paused = paused;
}

bool AnimationDriver::isPaused() const {
    return m_paused;
}

QVector<WaveCurve> AnimationDriver::computeFrame() const {
    // Work on a snapshot so every curve of a frame sees the same parameters
    const SimulationParameters snapshot = *m_params;

    QVector<WaveCurve> curves;
    if (snapshot.whiteLightEnabled) {
        curves.reserve(static_cast<int>(kPrismWavelengths.size()));
        for (double wl : kPrismWavelengths) {
            curves.append({wl, wavelengthToRGB(wl), computeWave(snapshot, wl)});
        }
    } else {
        curves.append({snapshot.wavelength, wavelengthToRGB(snapshot.wavelength),
                       computeWave(snapshot, snapshot.wavelength)});
    }
    return curves;
}

void AnimationDriver::tick() {
    if (m_paused) {
        return;
    }
    m_params->advanceTime(kTimeStep);
    qCDebug(lcAnimation) << "tick, t =" << m_params->time;
    emit frameReady(computeFrame());
}
