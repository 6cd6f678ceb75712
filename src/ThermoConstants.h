#pragma once

// Constants shared by the heat, pressure and phase model.
namespace ThermoConstants {

    // Supported temperature range (Celsius)
    constexpr double MIN_TEMP_C = -273.0;
    constexpr double MAX_TEMP_C = 10000.0;
    constexpr double KELVIN_OFFSET = 273.15;

    // Cell geometry. Mass scales with dx^3 while conduction contact scales with dx,
    // so a small cell equalizes quickly.
    constexpr double CELL_SIZE_M = 0.001;
    constexpr double CELL_VOLUME_M3 = CELL_SIZE_M * CELL_SIZE_M * CELL_SIZE_M;
    constexpr double CELL_FACE_AREA_M2 = CELL_SIZE_M * CELL_SIZE_M;

    // Default ambient conditions
    constexpr double DEFAULT_AMBIENT_TEMP_C = 20.0;
    constexpr double DEFAULT_AMBIENT_PRESSURE_PA = 101325.0;

    constexpr double GRAVITY_M_S2 = 9.81;
    constexpr double STEFAN_BOLTZMANN = 5.670374419e-8;

    // Cells below visible red heat do not radiate
    constexpr double RADIATION_VISIBLE_START_C = 700.0;

    // Numeric guards
    constexpr double MIN_PRESSURE_PA = 1.0;
    constexpr double MAX_PRESSURE_PA = 1.0e9;
    constexpr double MIN_GAS_MASS_KG = 1.0e-15;
    constexpr double GAS_REVERT_MASS_KG = 1.0e-13;
    constexpr double MIN_LIQUID_RANGE_K = 1.0;

    // Clausius-Clapeyron reference point for the water family
    constexpr double WATER_VAPOR_GAS_CONSTANT = 461.5;
    constexpr double REFERENCE_PRESSURE_PA = 101325.0;

    constexpr double DEFAULT_TICK_SECONDS = 1.0 / 60.0;
}
