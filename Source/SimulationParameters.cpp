#include "../Header/SimulationParameters.h"
#include "../Header/Logging.h"

#include <cmath>

namespace {

bool reject(const char* field, double value, ParameterError error) {
    qCWarning(lcParams).nospace() << "rejected " << field << " = " << value
                                  << ": " << parameterErrorString(error);
    return false;
}

ParameterError checkPositive(double value, ParameterError whenNotPositive) {
    if (!std::isfinite(value)) {
        return ParameterError::NonFiniteValue;
    }
    return value > 0.0 ? ParameterError::None : whenNotPositive;
}

ParameterError checkBoundaries(double first, double second) {
    if (!std::isfinite(first) || !std::isfinite(second)) {
        return ParameterError::NonFiniteValue;
    }
    if (first < 0.0 || second > kDomainMax) {
        return ParameterError::BoundaryOutOfDomain;
    }
    if (first >= second) {
        return ParameterError::InvalidBoundaryOrder;
    }
    return ParameterError::None;
}

} // namespace

QString parameterErrorString(ParameterError error) {
    switch (error) {
    case ParameterError::None:
        return QStringLiteral("no error");
    case ParameterError::InvalidBoundaryOrder:
        return QStringLiteral("boundary1 must be less than boundary2");
    case ParameterError::BoundaryOutOfDomain:
        return QStringLiteral("boundaries must lie within [0, %1]").arg(kDomainMax);
    case ParameterError::NonPositiveRefractiveIndex:
        return QStringLiteral("refractive index must be positive");
    case ParameterError::NonPositiveWavelength:
        return QStringLiteral("wavelength must be positive");
    case ParameterError::NonPositiveAmplitude:
        return QStringLiteral("amplitude must be positive");
    case ParameterError::NonPositiveSpeed:
        return QStringLiteral("speed must be positive");
    case ParameterError::NonFiniteValue:
        return QStringLiteral("value must be finite");
    }
    return QStringLiteral("unknown error");
}

bool SimulationParameters::setWavelength(double nm) {
    const ParameterError error = checkPositive(nm, ParameterError::NonPositiveWavelength);
    if (error != ParameterError::None) {
        return reject("wavelength", nm, error);
    }
    wavelength = nm;
    return true;
}

bool SimulationParameters::setAmplitude(double value) {
    const ParameterError error = checkPositive(value, ParameterError::NonPositiveAmplitude);
    if (error != ParameterError::None) {
        return reject("amplitude", value, error);
    }
    amplitude = value;
    return true;
}

bool SimulationParameters::setSpeed(double value) {
    const ParameterError error = checkPositive(value, ParameterError::NonPositiveSpeed);
    if (error != ParameterError::None) {
        return reject("speed", value, error);
    }
    speed = value;
    return true;
}

bool SimulationParameters::setN1(double n) {
    return setRefractiveIndex(1, n);
}

bool SimulationParameters::setN2(double n) {
    return setRefractiveIndex(2, n);
}

bool SimulationParameters::setN3(double n) {
    return setRefractiveIndex(3, n);
}

bool SimulationParameters::setRefractiveIndex(int medium, double n) {
    double* target = nullptr;
    switch (medium) {
    case 1: target = &n1; break;
    case 2: target = &n2; break;
    case 3: target = &n3; break;
    default:
        qCWarning(lcParams) << "no medium" << medium << "- expected 1, 2 or 3";
        return false;
    }

    const ParameterError error = checkPositive(n, ParameterError::NonPositiveRefractiveIndex);
    if (error != ParameterError::None) {
        return reject("refractive index", n, error);
    }
    *target = n;
    return true;
}

double SimulationParameters::refractiveIndex(int medium) const {
    switch (medium) {
    case 1: return n1;
    case 2: return n2;
    case 3: return n3;
    default: return 0.0;
    }
}

bool SimulationParameters::setBoundary1(double x) {
    const ParameterError error = checkBoundaries(x, boundary2);
    if (error != ParameterError::None) {
        return reject("boundary1", x, error);
    }
    boundary1 = x;
    return true;
}

bool SimulationParameters::setBoundary2(double x) {
    const ParameterError error = checkBoundaries(boundary1, x);
    if (error != ParameterError::None) {
        return reject("boundary2", x, error);
    }
    boundary2 = x;
    return true;
}

bool SimulationParameters::setBoundaries(double first, double second) {
    const ParameterError error = checkBoundaries(first, second);
    if (error != ParameterError::None) {
        qCWarning(lcParams).nospace() << "rejected boundaries (" << first << ", " << second
                                      << "): " << parameterErrorString(error);
        return false;
    }
    boundary1 = first;
    boundary2 = second;
    return true;
}

void SimulationParameters::setDispersionEnabled(bool enabled) {
    if (dispersionEnabled != enabled) {
        qCInfo(lcParams) << "dispersion" << (enabled ? "enabled" : "disabled");
    }
    dispersionEnabled = enabled;
}

void SimulationParameters::setWhiteLightEnabled(bool enabled) {
    if (whiteLightEnabled != enabled) {
        qCInfo(lcParams) << "white light" << (enabled ? "enabled" : "disabled");
    }
    whiteLightEnabled = enabled;
}

void SimulationParameters::advanceTime(double dt) {
    time += dt;
}

void SimulationParameters::resetTime() {
    time = 0.0;
}

ParameterError SimulationParameters::validate() const {
    ParameterError error = checkPositive(wavelength, ParameterError::NonPositiveWavelength);
    if (error != ParameterError::None) return error;
    error = checkPositive(amplitude, ParameterError::NonPositiveAmplitude);
    if (error != ParameterError::None) return error;
    error = checkPositive(speed, ParameterError::NonPositiveSpeed);
    if (error != ParameterError::None) return error;
    for (double n : {n1, n2, n3}) {
        error = checkPositive(n, ParameterError::NonPositiveRefractiveIndex);
        if (error != ParameterError::None) return error;
    }
    if (!std::isfinite(time)) return ParameterError::NonFiniteValue;
    return checkBoundaries(boundary1, boundary2);
}
