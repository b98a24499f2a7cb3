#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "../Header/WaveField.h"

namespace {

constexpr double kPi = 3.14159265358979323846;

// Index of the first sample strictly greater than x
int firstIndexAfter(double x) {
    const QVector<double>& positions = samplePositions();
    for (int i = 0; i < positions.size(); ++i) {
        if (positions[i] > x) return i;
    }
    return positions.size();
}

double maxAbsDifference(const QVector<double>& a, const QVector<double>& b) {
    double worst = 0.0;
    for (int i = 0; i < a.size(); ++i) {
        worst = std::max(worst, std::fabs(a[i] - b[i]));
    }
    return worst;
}

} // namespace

TEST(WaveFieldTest, PositionsSpanTheFixedDomain) {
    const QVector<double>& x = samplePositions();
    ASSERT_EQ(x.size(), kSampleCount);
    EXPECT_DOUBLE_EQ(x.front(), 0.0);
    EXPECT_DOUBLE_EQ(x.back(), kDomainMax);
    const double step = kDomainMax / (kSampleCount - 1);
    for (int i = 1; i < x.size(); ++i) {
        EXPECT_NEAR(x[i] - x[i - 1], step, 1e-9);
    }
}

TEST(WaveFieldTest, ReturnsOneFiniteSamplePerPosition) {
    SimulationParameters params;
    params.time = 3.7;
    const QVector<double> wave = computeWave(params, params.wavelength);
    ASSERT_EQ(wave.size(), kSampleCount);
    for (double v : wave) {
        EXPECT_TRUE(std::isfinite(v));
        EXPECT_LE(std::fabs(v), params.amplitude * kVisualizationScale + 1e-12);
    }
}

TEST(WaveFieldTest, EveryPrismWavelengthProducesAFullWave) {
    SimulationParameters params;
    params.dispersionEnabled = true;
    params.time = 1.25;
    for (double wl : kPrismWavelengths) {
        const QVector<double> wave = computeWave(params, wl);
        ASSERT_EQ(wave.size(), kSampleCount) << wl;
        for (double v : wave) {
            ASSERT_TRUE(std::isfinite(v)) << wl;
        }
    }
}

TEST(WaveFieldTest, ValueAtOriginIsZeroAtTimeZero) {
    SimulationParameters params;
    const QVector<double> wave = computeWave(params, 550.0);
    EXPECT_DOUBLE_EQ(wave[0], 0.0);
}

TEST(WaveFieldTest, MediumOneFollowsTravellingSine) {
    SimulationParameters params;
    params.time = 0.4;
    const QVector<double> wave = computeWave(params, 550.0);
    const QVector<double>& x = samplePositions();
    const double k1 = 2.0 * kPi * params.n1 / 550.0;
    for (int i : {0, 1, 250, 999}) {
        EXPECT_NEAR(wave[i], 0.5 * std::sin(k1 * x[i] - params.speed * params.time), 1e-12) << i;
    }
}

TEST(WaveFieldTest, MediumTwoPhaseRestartsAtFirstBoundary) {
    SimulationParameters params;
    const QVector<double> wave = computeWave(params, 550.0);
    const QVector<double>& x = samplePositions();

    const int first = firstIndexAfter(params.boundary1);
    ASSERT_EQ(first, 1000);
    const double k2 = 2.0 * kPi * params.n2 / 550.0;
    const double expected = 0.5 * std::sin(k2 * (x[first] - params.boundary1));
    EXPECT_NEAR(wave[first], expected, 1e-12);
    // Less than a sample spacing into the medium, the wave is still near zero
    EXPECT_LT(std::fabs(wave[first]), 0.5 * k2 * (x[first] - params.boundary1) + 1e-12);
}

TEST(WaveFieldTest, MediumThreePhaseRestartsAtSecondBoundary) {
    SimulationParameters params;
    params.time = 0.2;
    const QVector<double> wave = computeWave(params, 550.0);
    const QVector<double>& x = samplePositions();

    const int first = firstIndexAfter(params.boundary2);
    const double k3 = 2.0 * kPi * params.n3 / 550.0;
    EXPECT_NEAR(wave[first],
                0.5 * std::sin(k3 * (x[first] - params.boundary2) - params.speed * params.time),
                1e-12);
    EXPECT_NEAR(wave[first + 10],
                0.5 * std::sin(k3 * (x[first + 10] - params.boundary2) - params.speed * params.time),
                1e-12);
}

TEST(WaveFieldTest, SampleOnBoundaryBelongsToLeftMedium) {
    SimulationParameters params;
    params.boundary1 = samplePositions()[400];
    EXPECT_EQ(regionOf(params, params.boundary1), Region::Medium1);
    EXPECT_EQ(regionOf(params, samplePositions()[401]), Region::Medium2);
    EXPECT_EQ(regionOf(params, params.boundary2), Region::Medium2);
    EXPECT_EQ(regionOf(params, params.boundary2 + 0.5), Region::Medium3);
}

TEST(WaveFieldTest, SmallTimeStepChangesEachSampleSmoothly) {
    SimulationParameters params;
    params.time = 2.0;
    const QVector<double> before = computeWave(params, 550.0);
    const double dt = 1e-4;
    params.time += dt;
    const QVector<double> after = computeWave(params, 550.0);

    // |d/dt A*S*sin(...)| <= A*S*speed
    const double bound = params.amplitude * kVisualizationScale * params.speed * dt;
    EXPECT_LE(maxAbsDifference(before, after), bound * (1.0 + 1e-9));
    EXPECT_GT(maxAbsDifference(before, after), 0.0);
}

TEST(WaveFieldTest, DispersionAdjustsOnlyTheDenserMedia) {
    SimulationParameters params;
    params.dispersionEnabled = true;

    const EffectiveIndices blue = effectiveIndices(params, 400.0);
    const EffectiveIndices red = effectiveIndices(params, 700.0);

    EXPECT_DOUBLE_EQ(blue.n1, params.n1);
    EXPECT_DOUBLE_EQ(red.n1, params.n1);
    EXPECT_NEAR(blue.n2, params.n2 + 0.0006 * std::pow(550.0 / 400.0, 2), 1e-12);
    EXPECT_NEAR(blue.n3, params.n3 + 0.0008 * std::pow(550.0 / 400.0, 2), 1e-12);
    EXPECT_NEAR(red.n2, params.n2 + 0.0006 * std::pow(550.0 / 700.0, 2), 1e-12);
    EXPECT_NEAR(red.n3, params.n3 + 0.0008 * std::pow(550.0 / 700.0, 2), 1e-12);
    EXPECT_GT(blue.n2, red.n2);
    EXPECT_GT(blue.n3, red.n3);
}

TEST(WaveFieldTest, DispersionOffLeavesIndicesUnchanged) {
    SimulationParameters params;
    const EffectiveIndices n = effectiveIndices(params, 400.0);
    EXPECT_DOUBLE_EQ(n.n1, params.n1);
    EXPECT_DOUBLE_EQ(n.n2, params.n2);
    EXPECT_DOUBLE_EQ(n.n3, params.n3);
}

TEST(WaveFieldTest, DispersionChangesWaveInDenserMediaOnly) {
    SimulationParameters plain;
    plain.time = 0.3;
    SimulationParameters dispersive = plain;
    dispersive.dispersionEnabled = true;

    const QVector<double> a = computeWave(plain, 400.0);
    const QVector<double> b = computeWave(dispersive, 400.0);
    const QVector<double>& x = samplePositions();

    const int mid2 = firstIndexAfter(1500.0);
    for (int i = 0; i < firstIndexAfter(plain.boundary1); ++i) {
        ASSERT_DOUBLE_EQ(a[i], b[i]) << i;
    }
    EXPECT_NE(a[mid2], b[mid2]);

    const double k2 = waveNumber(effectiveIndices(dispersive, 400.0).n2, 400.0);
    EXPECT_NEAR(b[mid2], 0.5 * std::sin(k2 * (x[mid2] - 1000.0) - 2.0 * 0.3), 1e-12);
}

TEST(WaveFieldTest, DispersiveWavesDifferBetweenBlueAndRed) {
    SimulationParameters params;
    params.dispersionEnabled = true;
    const double k2blue = waveNumber(effectiveIndices(params, 400.0).n2, 400.0);
    const double k2red = waveNumber(effectiveIndices(params, 700.0).n2, 700.0);
    EXPECT_GT(k2blue, k2red);
    EXPECT_NE(computeWave(params, 400.0), computeWave(params, 700.0));
}

TEST(WaveFieldTest, IdenticalParametersGiveIdenticalWaves) {
    SimulationParameters params;
    params.time = 12.34;
    params.dispersionEnabled = true;
    EXPECT_EQ(computeWave(params, 450.0), computeWave(params, 450.0));
}

TEST(WaveFieldTest, ReversedBoundariesCollapseMediumTwo) {
    SimulationParameters params;
    params.boundary1 = 2000.0;
    params.boundary2 = 1000.0;
    params.time = 0.5;

    const QVector<double> wave = computeWave(params, 550.0);
    ASSERT_EQ(wave.size(), kSampleCount);
    for (double v : wave) {
        ASSERT_TRUE(std::isfinite(v));
    }
    EXPECT_EQ(wave, computeWave(params, 550.0));

    // Same as an empty medium 2 sitting at boundary1
    SimulationParameters collapsed = params;
    collapsed.boundary2 = 2000.0;
    EXPECT_EQ(wave, computeWave(collapsed, 550.0));

    const QVector<double>& x = samplePositions();
    const double k1 = waveNumber(params.n1, 550.0);
    const double k3 = waveNumber(params.n3, 550.0);
    const int last1 = firstIndexAfter(2000.0) - 1;
    EXPECT_NEAR(wave[last1], 0.5 * std::sin(k1 * x[last1] - 1.0), 1e-12);
    EXPECT_NEAR(wave[last1 + 1], 0.5 * std::sin(k3 * (x[last1 + 1] - 2000.0) - 1.0), 1e-12);
    EXPECT_EQ(regionOf(params, 1500.0), Region::Medium1);
    EXPECT_EQ(regionOf(params, 2500.0), Region::Medium3);
}

TEST(WaveFieldTest, BoundariesOutsideDomainAreClamped) {
    SimulationParameters params;
    params.boundary1 = -100.0;
    params.boundary2 = 5000.0;
    const QVector<double> wave = computeWave(params, 550.0);
    const QVector<double>& x = samplePositions();
    const double k2 = waveNumber(params.n2, 550.0);

    // Only x = 0 stays in medium 1, medium 3 is empty
    EXPECT_DOUBLE_EQ(wave[0], 0.0);
    EXPECT_NEAR(wave.back(), 0.5 * std::sin(k2 * x.back()), 1e-12);
}

TEST(WaveFieldTest, NonPositiveWavelengthGivesFlatWave) {
    SimulationParameters params;
    params.time = 1.0;
    for (double wl : {0.0, -550.0, std::nan("")}) {
        const QVector<double> wave = computeWave(params, wl);
        ASSERT_EQ(wave.size(), kSampleCount);
        for (double v : wave) {
            ASSERT_EQ(v, 0.0);
        }
    }
}

TEST(WaveFieldTest, AmplitudeScalesLinearly) {
    SimulationParameters params;
    params.time = 0.9;
    const QVector<double> base = computeWave(params, 600.0);
    params.amplitude = 10.0;
    const QVector<double> doubled = computeWave(params, 600.0);
    for (int i = 0; i < base.size(); i += 97) {
        EXPECT_NEAR(doubled[i], 2.0 * base[i], 1e-12);
    }
}
