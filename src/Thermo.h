#pragma once
#include "Material.h"

// Piecewise-linear enthalpy model. Energy is stored per cell and measured
// from absolute zero; temperature and phase are always derived from it.
//
//   E < meltStart            solid ramp
//   [meltStart, meltEnd)     melting plateau, T == Tm
//   [meltEnd, boilStart)     liquid ramp
//   [boilStart, boilEnd)     boiling plateau, T == Tb
//   E >= boilEnd             gas ramp
namespace Thermo {

struct PhaseBands {
    double meltStart;
    double meltEnd;
    double boilStart;
    double boilEnd;
    double meltC;
    double boilC;
    double cpSolid;
    double cpLiquid;
    double cpGas;
};

double clampTempC(double tempC);
double celsiusToKelvin(double tempC);
double kelvinToCelsius(double tempK);

double meltPointC(MaterialFamily family);

// Boil point at the given pressure. Water follows an idealized
// Clausius-Clapeyron curve; other families boil at a fixed point.
// Never lower than the melt point plus MIN_LIQUID_RANGE_K.
double boilPointC(MaterialFamily family, double pressurePa);

PhaseBands bands(MaterialFamily family, double massKg, double pressurePa);

double temperatureC(MaterialType type, double energyJ, double massKg, double pressurePa);

// Inverse of temperatureC. A temperature sitting exactly on a plateau
// resolves to the plateau edge matching the current phase of 'type'.
double energyForTemperature(MaterialType type, double tempC, double massKg, double pressurePa);

// Solid/liquid/gas member of the same family whose band holds energyJ.
// Phase-locked materials and air are returned unchanged.
MaterialType updatePhase(MaterialType type, double energyJ, double massKg, double pressurePa);

// Ideal gas over one cell volume (pV = mRT).
double massForPressureTemperature(MaterialType type, double pressurePa, double tempC);
double pressureForMassTemperature(MaterialType type, double massKg, double tempC);

double sensibleHeatCapacity(MaterialType type, double massKg);

} // namespace Thermo
