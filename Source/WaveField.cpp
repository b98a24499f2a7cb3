#include "../Header/WaveField.h"
#include "../Header/Logging.h"

#include <algorithm>
#include <cmath>

namespace {

constexpr double kTwoPi = 2.0 * M_PI;

// Cauchy-style coefficients relative to 550 nm
constexpr double kReferenceWavelength = 550.0;
constexpr double kDispersionCoeff2 = 0.0006;
constexpr double kDispersionCoeff3 = 0.0008;

struct Boundaries {
    double first;
    double second;
};

Boundaries clampedBoundaries(const SimulationParameters& params) {
    Boundaries b;
    b.first = std::clamp(params.boundary1, 0.0, kDomainMax);
    b.second = std::clamp(params.boundary2, 0.0, kDomainMax);
    if (std::isnan(b.first)) b.first = 0.0;
    if (std::isnan(b.second)) b.second = kDomainMax;
    if (b.second < b.first) {
        b.second = b.first;
    }
    return b;
}

QVector<double> buildPositions() {
    QVector<double> x(kSampleCount);
    const double step = kDomainMax / (kSampleCount - 1);
    for (int i = 0; i < kSampleCount; ++i) {
        x[i] = i * step;
    }
    x[kSampleCount - 1] = kDomainMax;
    return x;
}

} // namespace

const QVector<double>& samplePositions() {
    static const QVector<double> positions = buildPositions();
    return positions;
}

EffectiveIndices effectiveIndices(const SimulationParameters& params, double wavelengthNm) {
    EffectiveIndices n{params.n1, params.n2, params.n3};
    if (params.dispersionEnabled && wavelengthNm > 0.0) {
        const double ratio = kReferenceWavelength / wavelengthNm;
        n.n2 += kDispersionCoeff2 * ratio * ratio;
        n.n3 += kDispersionCoeff3 * ratio * ratio;
    }
    return n;
}

double waveNumber(double n, double wavelengthNm) {
    return kTwoPi * n / wavelengthNm;
}

Region regionOf(const SimulationParameters& params, double x) {
    const Boundaries b = clampedBoundaries(params);
    if (x <= b.first) return Region::Medium1;
    if (x <= b.second) return Region::Medium2;
    return Region::Medium3;
}

QVector<double> computeWave(const SimulationParameters& params, double wavelengthNm) {
    const QVector<double>& x = samplePositions();
    QVector<double> wave(x.size(), 0.0);

    if (!(wavelengthNm > 0.0) || !std::isfinite(wavelengthNm)) {
        qCDebug(lcWaveField) << "no wave for wavelength" << wavelengthNm;
        return wave;
    }

    const EffectiveIndices n = effectiveIndices(params, wavelengthNm);
    const double k1 = waveNumber(n.n1, wavelengthNm);
    const double k2 = waveNumber(n.n2, wavelengthNm);
    const double k3 = waveNumber(n.n3, wavelengthNm);
    const double scale = params.amplitude * kVisualizationScale;
    const double phase_t = params.speed * params.time;

    // Positions are sorted, so each medium is a contiguous index range
    const Boundaries b = clampedBoundaries(params);
    const int size = x.size();
    const int b1_idx = std::upper_bound(x.begin(), x.end(), b.first) - x.begin();
    const int b2_idx = std::upper_bound(x.begin(), x.end(), b.second) - x.begin();

    for (int i = 0; i < b1_idx; ++i) {
        wave[i] = scale * std::sin(k1 * x[i] - phase_t);
    }
    for (int i = b1_idx; i < b2_idx; ++i) {
        wave[i] = scale * std::sin(k2 * (x[i] - b.first) - phase_t);
    }
    for (int i = b2_idx; i < size; ++i) {
        wave[i] = scale * std::sin(k3 * (x[i] - b.second) - phase_t);
    }

    qCDebug(lcWaveField).nospace() << "wave " << wavelengthNm << " nm: k = (" << k1 << ", "
                                   << k2 << ", " << k3 << "), t = " << params.time;
    return wave;
}
