#include "../Header/WaveSimulationWidget.h"
#include "../Header/ColorUtils.h"
#include "../Header/Logging.h"
#include "../Header/WaveField.h"

WaveSimulationWidget::WaveSimulationWidget(QWidget* parent)
    : QCustomPlot(parent), m_amplitude(5.0), m_zoom(1.0) {
    // Set up plot appearance
    setBackground(QColor(45, 45, 48));
    for (QCPAxis* axis : {xAxis, yAxis}) {
        axis->setBasePen(QPen(Qt::white));
        axis->setTickPen(QPen(Qt::white));
        axis->setSubTickPen(QPen(Qt::white));
        axis->setTickLabelColor(Qt::white);
        axis->setLabelColor(Qt::white);
        axis->grid()->setPen(QPen(QColor(255, 255, 255, 60), 1, Qt::DotLine));
    }
    xAxis->setLabel("Position");
    yAxis->setLabel("Amplitude");
    xAxis->setRange(0, kDomainMax);

    setAntialiasedElements(QCP::aeAll);
    setPlottingHint(QCP::phFastPolylines, true);
    setPlottingHint(QCP::phCacheLabels, true);
    setInteraction(QCP::iRangeDrag, false);
    setInteraction(QCP::iRangeZoom, false);

    plotLayout()->insertRow(0);
    title = new QCPTextElement(this, "Light Wave Refraction Visualization", QFont("Arial", 12, QFont::Bold));
    title->setTextColor(Qt::white);
    plotLayout()->addElement(0, 0, title);

    // Medium regions span the full height regardless of the y range
    for (int i = 0; i < 3; ++i) {
        QCPItemRect* rect = new QCPItemRect(this);
        rect->setPen(Qt::NoPen);
        rect->setLayer("background");
        rect->topLeft->setTypeY(QCPItemPosition::ptAxisRectRatio);
        rect->bottomRight->setTypeY(QCPItemPosition::ptAxisRectRatio);
        medium_rects[i] = rect;

        QCPItemText* label = new QCPItemText(this);
        label->setPositionAlignment(Qt::AlignHCenter | Qt::AlignTop);
        label->position->setTypeY(QCPItemPosition::ptAxisRectRatio);
        label->setColor(Qt::white);
        label->setFont(QFont("Arial", 12, QFont::Bold));
        medium_labels[i] = label;
    }

    boundary1_line = new QCPItemStraightLine(this);
    boundary1_line->setPen(QPen(Qt::white, 2, Qt::DashLine));
    boundary2_line = new QCPItemStraightLine(this);
    boundary2_line->setPen(QPen(Qt::white, 2, Qt::DashLine));

    x = samplePositions();

    wave_curve = addGraph();
    wave_curve->setAdaptiveSampling(true);
    wave_curve->setLineStyle(QCPGraph::lsLine);

    for (double wl : kPrismWavelengths) {
        QCPGraph* curve = addGraph();
        curve->setPen(QPen(wavelengthToRGB(wl), 4));
        curve->setAdaptiveSampling(true);
        curve->setVisible(false);
        prism_curves.append(curve);
    }

    rescaleVertical();
}

double WaveSimulationWidget::verticalHalfRange(double amplitude, double zoom) {
    return amplitude * kVisualizationScale * 1.5 / zoom;
}

void WaveSimulationWidget::setZoom(double zoom) {
    if (zoom <= 0.0) {
        qCWarning(lcUi) << "ignoring zoom" << zoom;
        return;
    }
    m_zoom = zoom;
    rescaleVertical();
    replot(QCustomPlot::rpQueuedReplot);
}

void WaveSimulationWidget::rescaleVertical() {
    const double half = verticalHalfRange(m_amplitude, m_zoom);
    yAxis->setRange(-half, half);
}

void WaveSimulationWidget::refreshDecorations(const SimulationParameters& params,
                                              const MediumSelection& media) {
    const double edges[4] = {0.0, params.boundary1, params.boundary2, kDomainMax};
    for (int i = 0; i < 3; ++i) {
        const int slot = i + 1;
        const Medium* medium = findMedium(media.name(slot));

        medium_rects[i]->setBrush(QBrush(medium ? medium->color : QColor(128, 128, 128, 60)));
        medium_rects[i]->topLeft->setCoords(edges[i], 0.0);
        medium_rects[i]->bottomRight->setCoords(edges[i + 1], 1.0);

        medium_labels[i]->setText(mediumLabel(media.name(slot), slot, params.refractiveIndex(slot)));
        medium_labels[i]->position->setCoords((edges[i] + edges[i + 1]) / 2.0, 0.04);
    }

    boundary1_line->point1->setCoords(params.boundary1, 0);
    boundary1_line->point2->setCoords(params.boundary1, 1);
    boundary2_line->point1->setCoords(params.boundary2, 0);
    boundary2_line->point2->setCoords(params.boundary2, 1);

    if (!params.whiteLightEnabled) {
        wave_curve->setPen(QPen(wavelengthToRGB(params.wavelength), 4));
    }

    if (m_amplitude != params.amplitude) {
        m_amplitude = params.amplitude;
        rescaleVertical();
    }

    replot(QCustomPlot::rpQueuedReplot);
}

void WaveSimulationWidget::showFrame(const QVector<WaveCurve>& curves) {
    if (curves.size() == prism_curves.size()) {
        for (int i = 0; i < curves.size(); ++i) {
            prism_curves[i]->setData(x, curves[i].samples, true);
        }
    } else if (curves.size() == 1) {
        wave_curve->setData(x, curves.front().samples, true);
    } else {
        qCWarning(lcUi) << "unexpected frame with" << curves.size() << "curves";
        return;
    }
    replot(QCustomPlot::rpQueuedReplot);
}

void WaveSimulationWidget::setWhiteLight(bool enabled) {
    wave_curve->setVisible(!enabled);
    for (QCPGraph* curve : prism_curves) {
        curve->setVisible(enabled);
    }

    title->setText(enabled ? "White Light Dispersion (Prism Effect)"
                           : "Light Wave Refraction Visualization");
    replot(QCustomPlot::rpQueuedReplot);
}
