#include "Thermo.h"
#include "ThermoConstants.h"
#include <algorithm>
#include <cmath>

using namespace ThermoConstants;

namespace Thermo {

double clampTempC(double tempC) {
    if (std::isnan(tempC)) return MIN_TEMP_C;
    return std::clamp(tempC, MIN_TEMP_C, MAX_TEMP_C);
}

double celsiusToKelvin(double tempC) {
    return tempC + KELVIN_OFFSET;
}

double kelvinToCelsius(double tempK) {
    return tempK - KELVIN_OFFSET;
}

double meltPointC(MaterialFamily family) {
    const FamilyDefinition& fam = Materials::family(family);
    if (!fam.hasPhaseChanges) return MAX_TEMP_C;
    return fam.meltPointC;
}

double boilPointC(MaterialFamily family, double pressurePa) {
    const FamilyDefinition& fam = Materials::family(family);
    if (!fam.hasPhaseChanges) return MAX_TEMP_C;

    double boilC = fam.boilPointC;
    if (fam.pressureDependentBoiling && fam.latentVaporJKg > 0.0) {
        double p = std::clamp(pressurePa, MIN_PRESSURE_PA, MAX_PRESSURE_PA);
        double refK = celsiusToKelvin(fam.boilPointC);
        double gasR = Materials::gasOf(family).gasConstantJKgK;
        double inv = 1.0 / refK - (gasR / fam.latentVaporJKg) * std::log(p / REFERENCE_PRESSURE_PA);
        boilC = (inv <= 0.0) ? MAX_TEMP_C : kelvinToCelsius(1.0 / inv);
    }

    boilC = clampTempC(boilC);
    double minBoil = fam.meltPointC + MIN_LIQUID_RANGE_K;
    return std::max(boilC, minBoil);
}

PhaseBands bands(MaterialFamily family, double massKg, double pressurePa) {
    const FamilyDefinition& fam = Materials::family(family);
    double m = std::max(massKg, 0.0);

    PhaseBands b{};
    b.cpSolid = Materials::solidOf(family).specificHeatJKgK;
    b.cpLiquid = Materials::liquidOf(family).specificHeatJKgK;
    b.cpGas = Materials::gasOf(family).specificHeatJKgK;
    b.meltC = meltPointC(family);
    b.boilC = boilPointC(family, pressurePa);

    b.meltStart = m * b.cpSolid * celsiusToKelvin(b.meltC);
    b.meltEnd = b.meltStart + m * fam.latentFusionJKg;
    b.boilStart = b.meltEnd + m * b.cpLiquid * (b.boilC - b.meltC);
    b.boilEnd = b.boilStart + m * fam.latentVaporJKg;
    return b;
}

double temperatureC(MaterialType type, double energyJ, double massKg, double pressurePa) {
    const MaterialDefinition& def = Materials::lookup(type);
    double e = std::max(energyJ, 0.0);

    if (!Materials::family(def.family).hasPhaseChanges) {
        double denom = massKg * def.specificHeatJKgK;
        if (denom <= 0.0) return MIN_TEMP_C;
        return clampTempC(kelvinToCelsius(e / denom));
    }

    PhaseBands b = bands(def.family, massKg, pressurePa);
    double t;
    if (e < b.meltStart) {
        double denom = massKg * b.cpSolid;
        t = (denom <= 0.0) ? MIN_TEMP_C : kelvinToCelsius(e / denom);
    } else if (e < b.meltEnd) {
        t = b.meltC;
    } else if (e < b.boilStart) {
        double denom = massKg * b.cpLiquid;
        t = (denom <= 0.0) ? b.meltC : b.meltC + (e - b.meltEnd) / denom;
    } else if (e < b.boilEnd) {
        t = b.boilC;
    } else {
        double denom = massKg * b.cpGas;
        t = (denom <= 0.0) ? b.boilC : b.boilC + (e - b.boilEnd) / denom;
    }
    return clampTempC(t);
}

double energyForTemperature(MaterialType type, double tempC, double massKg, double pressurePa) {
    const MaterialDefinition& def = Materials::lookup(type);
    double t = clampTempC(tempC);
    double m = std::max(massKg, 0.0);

    if (!Materials::family(def.family).hasPhaseChanges) {
        return m * def.specificHeatJKgK * celsiusToKelvin(t);
    }

    PhaseBands b = bands(def.family, m, pressurePa);

    if (t < b.meltC) return m * b.cpSolid * celsiusToKelvin(t);
    if (t > b.boilC) return b.boilEnd + m * b.cpGas * (t - b.boilC);
    if (t > b.meltC && t < b.boilC) return b.meltEnd + m * b.cpLiquid * (t - b.meltC);

    // Exactly on a plateau edge
    if (t == b.meltC) {
        return (def.phase == Phase::SOLID) ? b.meltStart : b.meltEnd;
    }
    return (def.phase == Phase::GAS) ? b.boilEnd : b.boilStart;
}

MaterialType updatePhase(MaterialType type, double energyJ, double massKg, double pressurePa) {
    const MaterialDefinition& def = Materials::lookup(type);
    if (def.phaseLocked) return type;

    const FamilyDefinition& fam = Materials::family(def.family);
    if (!fam.hasPhaseChanges) return type;

    PhaseBands b = bands(def.family, massKg, pressurePa);

    if (energyJ <= b.meltStart) return fam.solid;
    if (energyJ >= b.boilEnd) return fam.gas;
    if (energyJ >= b.meltEnd && energyJ <= b.boilStart) return fam.liquid;

    // Plateaus keep whichever neighbouring phase the cell is already in
    if (energyJ < b.meltEnd) {
        if (type == fam.solid || type == fam.liquid) return type;
        double mid = (b.meltStart + b.meltEnd) * 0.5;
        return (energyJ < mid) ? fam.solid : fam.liquid;
    }

    if (type == fam.liquid || type == fam.gas) return type;
    double mid = (b.boilStart + b.boilEnd) * 0.5;
    return (energyJ < mid) ? fam.liquid : fam.gas;
}

double massForPressureTemperature(MaterialType type, double pressurePa, double tempC) {
    const MaterialDefinition& def = Materials::lookup(type);
    if (def.gasConstantJKgK <= 0.0) return Materials::condensedCellMassKg(type);

    double p = std::clamp(pressurePa, MIN_PRESSURE_PA, MAX_PRESSURE_PA);
    double tK = celsiusToKelvin(clampTempC(tempC));
    double m = p * CELL_VOLUME_M3 / (def.gasConstantJKgK * tK);
    return std::max(m, MIN_GAS_MASS_KG);
}

double pressureForMassTemperature(MaterialType type, double massKg, double tempC) {
    const MaterialDefinition& def = Materials::lookup(type);
    if (def.gasConstantJKgK <= 0.0) return DEFAULT_AMBIENT_PRESSURE_PA;

    double m = std::max(massKg, 0.0);
    double tK = celsiusToKelvin(clampTempC(tempC));
    double p = m * def.gasConstantJKgK * tK / CELL_VOLUME_M3;
    return std::clamp(p, MIN_PRESSURE_PA, MAX_PRESSURE_PA);
}

double sensibleHeatCapacity(MaterialType type, double massKg) {
    return std::max(massKg, 0.0) * Materials::lookup(type).specificHeatJKgK;
}

} // namespace Thermo
