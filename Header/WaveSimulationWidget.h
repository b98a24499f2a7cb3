#ifndef WAVESIMULATIONWIDGET_H
#define WAVESIMULATIONWIDGET_H

#include <qcustomplot.h>

#include <array>

#include "AnimationDriver.h"
#include "MediumPresets.h"
#include "SimulationParameters.h"

// Plot surface: medium regions, boundary lines, labels and the wave curves.
// It only draws; the parameters and the clock live in the main window.
class WaveSimulationWidget : public QCustomPlot {
    Q_OBJECT
public:
    explicit WaveSimulationWidget(QWidget* parent = nullptr);

    // Half height of the visible y range for an amplitude and zoom factor
    static double verticalHalfRange(double amplitude, double zoom);

    void setZoom(double zoom);

public slots:
    // Redraws regions, boundaries and labels from the current state
    void refreshDecorations(const SimulationParameters& params, const MediumSelection& media);
    void showFrame(const QVector<WaveCurve>& curves);
    void setWhiteLight(bool enabled);

private:
    void rescaleVertical();

    QVector<double> x;
    double m_amplitude;
    double m_zoom;

    QCPTextElement* title;
    std::array<QCPItemRect*, 3> medium_rects;
    std::array<QCPItemText*, 3> medium_labels;
    QCPItemStraightLine* boundary1_line;
    QCPItemStraightLine* boundary2_line;

    QCPGraph* wave_curve;
    QVector<QCPGraph*> prism_curves;
};

#endif // WAVESIMULATIONWIDGET_H
