#ifndef COLORUTILS_H
#define COLORUTILS_H

#include <QColor>

// Visible band covered by the colour mapping, in nm
constexpr double kVisibleMin = 380.0;
constexpr double kVisibleMax = 750.0;

// Speed of light expressed in nm * THz
constexpr double kSpeedOfLight = 299792.458;

// Convert wavelength (in nm) to an approximate visible RGB colour.
// Wavelengths outside [380, 750] give neutral grey (128, 128, 128).
QColor wavelengthToRGB(double wavelength);

// Convert frequency (in THz) to RGB
QColor frequencyToRGB(double frequency);

double frequencyToWavelength(double frequency);

#endif // COLORUTILS_H
