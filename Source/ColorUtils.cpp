#include "../Header/ColorUtils.h"

#include <cmath>

namespace {

// Rounds half to even (default FE_TONEAREST mode)
int toChannel(double value, double factor) {
    return static_cast<int>(std::nearbyint(255.0 * value * factor));
}

// Dims the colour towards both ends of the visible band
double edgeAttenuation(double wavelength) {
    if (wavelength >= 380 && wavelength < 420) {
        return 0.3 + 0.7 * (wavelength - 380) / (420 - 380);
    } else if (wavelength >= 420 && wavelength < 700) {
        return 1.0;
    } else if (wavelength >= 700 && wavelength <= 750) {
        return 0.3 + 0.7 * (750 - wavelength) / (750 - 700);
    }
    return 0.0;
}

} // namespace

QColor wavelengthToRGB(double wavelength) {
    // Piecewise linear approximation after Dan Bruton
    double r = 0.0, g = 0.0, b = 0.0;

    if (wavelength >= 380 && wavelength < 440) {
        r = -(wavelength - 440) / (440 - 380);
        g = 0.0;
        b = 1.0;
    } else if (wavelength >= 440 && wavelength < 490) {
        r = 0.0;
        g = (wavelength - 440) / (490 - 440);
        b = 1.0;
    } else if (wavelength >= 490 && wavelength < 510) {
        r = 0.0;
        g = 1.0;
        b = -(wavelength - 510) / (510 - 490);
    } else if (wavelength >= 510 && wavelength < 580) {
        r = (wavelength - 510) / (580 - 510);
        g = 1.0;
        b = 0.0;
    } else if (wavelength >= 580 && wavelength < 645) {
        r = 1.0;
        g = -(wavelength - 645) / (645 - 580);
        b = 0.0;
    } else if (wavelength >= 645 && wavelength <= 750) {
        r = 1.0;
        g = 0.0;
        b = 0.0;
    } else {
        // Outside the visible spectrum, no attenuation
        return QColor(toChannel(0.5, 1.0), toChannel(0.5, 1.0), toChannel(0.5, 1.0));
    }

    const double factor = edgeAttenuation(wavelength);
    return QColor(toChannel(r, factor), toChannel(g, factor), toChannel(b, factor));
}

double frequencyToWavelength(double frequency) {
    return kSpeedOfLight / frequency;
}

QColor frequencyToRGB(double frequency) {
    if (!(frequency > 0.0)) {
        return wavelengthToRGB(0.0);
    }
    return wavelengthToRGB(frequencyToWavelength(frequency));
}
