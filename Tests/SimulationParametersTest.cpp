#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include <QStringList>

#include "../Header/SimulationParameters.h"

TEST(SimulationParametersTest, StartsWithDocumentedDefaults) {
    const SimulationParameters params;
    EXPECT_DOUBLE_EQ(params.wavelength, 550.0);
    EXPECT_DOUBLE_EQ(params.amplitude, 5.0);
    EXPECT_DOUBLE_EQ(params.speed, 2.0);
    EXPECT_DOUBLE_EQ(params.n1, 1.0003);
    EXPECT_DOUBLE_EQ(params.n2, 1.33);
    EXPECT_DOUBLE_EQ(params.n3, 1.52);
    EXPECT_DOUBLE_EQ(params.boundary1, 1000.0);
    EXPECT_DOUBLE_EQ(params.boundary2, 2000.0);
    EXPECT_FALSE(params.dispersionEnabled);
    EXPECT_FALSE(params.whiteLightEnabled);
    EXPECT_DOUBLE_EQ(params.time, 0.0);
    EXPECT_EQ(params.validate(), ParameterError::None);
}

TEST(SimulationParametersTest, AcceptsPositiveWaveValues) {
    SimulationParameters params;
    EXPECT_TRUE(params.setWavelength(420.0));
    EXPECT_TRUE(params.setAmplitude(8.0));
    EXPECT_TRUE(params.setSpeed(0.5));
    EXPECT_DOUBLE_EQ(params.wavelength, 420.0);
    EXPECT_DOUBLE_EQ(params.amplitude, 8.0);
    EXPECT_DOUBLE_EQ(params.speed, 0.5);
}

TEST(SimulationParametersTest, OutOfSpectrumWavelengthIsStillValid) {
    SimulationParameters params;
    EXPECT_TRUE(params.setWavelength(900.0));
    EXPECT_EQ(params.validate(), ParameterError::None);
}

TEST(SimulationParametersTest, RejectsNonPositiveOrNonFiniteValues) {
    SimulationParameters params;
    EXPECT_FALSE(params.setWavelength(0.0));
    EXPECT_FALSE(params.setWavelength(-1.0));
    EXPECT_FALSE(params.setAmplitude(0.0));
    EXPECT_FALSE(params.setSpeed(-2.0));
    EXPECT_FALSE(params.setSpeed(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(params.setAmplitude(std::nan("")));

    EXPECT_DOUBLE_EQ(params.wavelength, 550.0);
    EXPECT_DOUBLE_EQ(params.amplitude, 5.0);
    EXPECT_DOUBLE_EQ(params.speed, 2.0);
}

TEST(SimulationParametersTest, RefractiveIndexBySlot) {
    SimulationParameters params;
    EXPECT_TRUE(params.setN1(1.1));
    EXPECT_TRUE(params.setN2(1.2));
    EXPECT_TRUE(params.setRefractiveIndex(3, 2.42));
    EXPECT_DOUBLE_EQ(params.refractiveIndex(1), 1.1);
    EXPECT_DOUBLE_EQ(params.refractiveIndex(2), 1.2);
    EXPECT_DOUBLE_EQ(params.refractiveIndex(3), 2.42);

    EXPECT_FALSE(params.setN3(0.0));
    EXPECT_FALSE(params.setRefractiveIndex(2, -1.33));
    EXPECT_FALSE(params.setRefractiveIndex(0, 1.5));
    EXPECT_FALSE(params.setRefractiveIndex(4, 1.5));
    EXPECT_DOUBLE_EQ(params.n3, 2.42);
    EXPECT_DOUBLE_EQ(params.n2, 1.2);
}

TEST(SimulationParametersTest, BoundariesKeepTheirOrder) {
    SimulationParameters params;
    EXPECT_TRUE(params.setBoundary1(500.0));
    EXPECT_TRUE(params.setBoundary2(2500.0));

    EXPECT_FALSE(params.setBoundary1(2500.0));
    EXPECT_FALSE(params.setBoundary1(2600.0));
    EXPECT_FALSE(params.setBoundary2(500.0));
    EXPECT_FALSE(params.setBoundary2(100.0));

    EXPECT_DOUBLE_EQ(params.boundary1, 500.0);
    EXPECT_DOUBLE_EQ(params.boundary2, 2500.0);
}

TEST(SimulationParametersTest, BoundariesStayInsideDomain) {
    SimulationParameters params;
    EXPECT_FALSE(params.setBoundary1(-1.0));
    EXPECT_FALSE(params.setBoundary2(kDomainMax + 1.0));
    EXPECT_TRUE(params.setBoundaries(0.0, kDomainMax));
    EXPECT_DOUBLE_EQ(params.boundary1, 0.0);
    EXPECT_DOUBLE_EQ(params.boundary2, kDomainMax);
}

TEST(SimulationParametersTest, BoundaryPairMovesPastEachOther) {
    // One at a time this move is impossible without breaking the order
    SimulationParameters params;
    EXPECT_TRUE(params.setBoundaries(2200.0, 2800.0));
    EXPECT_DOUBLE_EQ(params.boundary1, 2200.0);
    EXPECT_DOUBLE_EQ(params.boundary2, 2800.0);

    EXPECT_FALSE(params.setBoundaries(2000.0, 1000.0));
    EXPECT_FALSE(params.setBoundaries(1500.0, 1500.0));
    EXPECT_DOUBLE_EQ(params.boundary1, 2200.0);
    EXPECT_DOUBLE_EQ(params.boundary2, 2800.0);
}

TEST(SimulationParametersTest, ValidateReportsBrokenInvariants) {
    SimulationParameters params;
    params.boundary1 = 2000.0;
    params.boundary2 = 1000.0;
    EXPECT_EQ(params.validate(), ParameterError::InvalidBoundaryOrder);

    params = SimulationParameters();
    params.boundary2 = 4000.0;
    EXPECT_EQ(params.validate(), ParameterError::BoundaryOutOfDomain);

    params = SimulationParameters();
    params.n2 = 0.0;
    EXPECT_EQ(params.validate(), ParameterError::NonPositiveRefractiveIndex);

    params = SimulationParameters();
    params.wavelength = -400.0;
    EXPECT_EQ(params.validate(), ParameterError::NonPositiveWavelength);

    params = SimulationParameters();
    params.time = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(params.validate(), ParameterError::NonFiniteValue);
}

TEST(SimulationParametersTest, ModeTogglesAreIndependent) {
    SimulationParameters params;
    params.setDispersionEnabled(true);
    EXPECT_TRUE(params.dispersionEnabled);
    EXPECT_FALSE(params.whiteLightEnabled);
    params.setWhiteLightEnabled(true);
    params.setDispersionEnabled(false);
    EXPECT_FALSE(params.dispersionEnabled);
    EXPECT_TRUE(params.whiteLightEnabled);
}

TEST(SimulationParametersTest, ClockAdvancesByFixedStep) {
    SimulationParameters params;
    for (int i = 0; i < 100; ++i) {
        params.advanceTime();
    }
    EXPECT_NEAR(params.time, 100 * kTimeStep, 1e-12);
    params.advanceTime(0.5);
    EXPECT_NEAR(params.time, 1.5, 1e-12);
    params.resetTime();
    EXPECT_DOUBLE_EQ(params.time, 0.0);
}

TEST(SimulationParametersTest, EveryErrorHasADistinctMessage) {
    const ParameterError errors[] = {
        ParameterError::None,
        ParameterError::InvalidBoundaryOrder,
        ParameterError::BoundaryOutOfDomain,
        ParameterError::NonPositiveRefractiveIndex,
        ParameterError::NonPositiveWavelength,
        ParameterError::NonPositiveAmplitude,
        ParameterError::NonPositiveSpeed,
        ParameterError::NonFiniteValue,
    };
    QStringList messages;
    for (ParameterError error : errors) {
        const QString message = parameterErrorString(error);
        EXPECT_FALSE(message.isEmpty());
        EXPECT_FALSE(messages.contains(message)) << message.toStdString();
        messages << message;
    }
}
