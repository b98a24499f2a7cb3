#ifndef ANIMATIONDRIVER_H
#define ANIMATIONDRIVER_H

#include <QColor>
#include <QObject>
#include <QTimer>
#include <QVector>

#include "SimulationParameters.h"

constexpr int kDefaultTickIntervalMs = 50;
constexpr int kMinTickIntervalMs = 1;

// One rendered waveform and the colour to draw it with
struct WaveCurve {
    double wavelength;
    QColor color;
    QVector<double> samples;
};

// Owns the simulation clock. Each tick advances time by kTimeStep and
// recomputes either the single wave or the seven white light waves.
class AnimationDriver : public QObject {
    Q_OBJECT
public:
    explicit AnimationDriver(SimulationParameters* params, QObject* parent = nullptr);

    void start(int intervalMs = kDefaultTickIntervalMs);
    void stop();
    bool isRunning() const;
    int interval() const;

    void setPaused(bool paused);
    bool isPaused() const;

    // Curves for the current parameters, without touching the clock
    QVector<WaveCurve> computeFrame() const;

public slots:
    void tick();

signals:
    void frameReady(const QVector<WaveCurve>& curves);

private:
    SimulationParameters* m_params;
    QTimer m_timer;
    bool m_paused;
};

#endif // ANIMATIONDRIVER_H
