#ifndef SIMULATIONPARAMETERS_H
#define SIMULATIONPARAMETERS_H

#include <QString>

#include <array>

// Fixed spatial domain: kSampleCount points spanning [0, kDomainMax]
constexpr int kSampleCount = 3000;
constexpr double kDomainMax = 3000.0;

constexpr double kVisualizationScale = 0.1;
constexpr double kTimeStep = 0.01;

// Wavelengths (nm) drawn in white light mode
constexpr std::array<double, 7> kPrismWavelengths = {400, 450, 500, 550, 600, 650, 700};

enum class ParameterError {
    None,
    InvalidBoundaryOrder,
    BoundaryOutOfDomain,
    NonPositiveRefractiveIndex,
    NonPositiveWavelength,
    NonPositiveAmplitude,
    NonPositiveSpeed,
    NonFiniteValue
};

QString parameterErrorString(ParameterError error);

// Simulation state owned by the host. Fields are public so the host can take
// a snapshot by value; the setters are the validated way to change them.
struct SimulationParameters {
    double wavelength{550.0};   // nm
    double amplitude{5.0};
    double speed{2.0};          // multiplies time in the phase
    double n1{1.0003};
    double n2{1.33};
    double n3{1.52};
    double boundary1{1000.0};
    double boundary2{2000.0};
    bool dispersionEnabled{false};
    bool whiteLightEnabled{false};
    double time{0.0};

    // Setters return false and leave the state untouched on invalid input
    bool setWavelength(double nm);
    bool setAmplitude(double value);
    bool setSpeed(double value);
    bool setN1(double n);
    bool setN2(double n);
    bool setN3(double n);
    bool setRefractiveIndex(int medium, double n);  // medium in 1..3
    double refractiveIndex(int medium) const;
    bool setBoundary1(double x);
    bool setBoundary2(double x);
    bool setBoundaries(double first, double second);
    void setDispersionEnabled(bool enabled);
    void setWhiteLightEnabled(bool enabled);

    void advanceTime(double dt = kTimeStep);
    void resetTime();

    // First violated invariant of the whole set, or ParameterError::None
    ParameterError validate() const;
};

#endif // SIMULATIONPARAMETERS_H
