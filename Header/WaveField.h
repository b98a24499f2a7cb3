#ifndef WAVEFIELD_H
#define WAVEFIELD_H

#include <QVector>

#include "SimulationParameters.h"

// Refractive indices after the optional dispersion correction
struct EffectiveIndices {
    double n1;
    double n2;
    double n3;
};

enum class Region { Medium1, Medium2, Medium3 };

// The fixed, evenly spaced sample positions over [0, kDomainMax]
const QVector<double>& samplePositions();

EffectiveIndices effectiveIndices(const SimulationParameters& params, double wavelengthNm);

double waveNumber(double n, double wavelengthNm);

// Region containing x; boundaries are clamped the same way computeWave does
Region regionOf(const SimulationParameters& params, double x);

// Amplitude at every sample position for the given wavelength.
//
// Each medium restarts its spatial phase at its left boundary:
//   medium 1: A*S*sin(k1*x - w*t)
//   medium 2: A*S*sin(k2*(x - boundary1) - w*t)
//   medium 3: A*S*sin(k3*(x - boundary2) - w*t)
//
// Boundaries are clamped into the domain and boundary2 is raised to boundary1
// when out of order, leaving medium 2 empty. A non-positive wavelength gives
// all zeros.
QVector<double> computeWave(const SimulationParameters& params, double wavelengthNm);

#endif // WAVEFIELD_H
