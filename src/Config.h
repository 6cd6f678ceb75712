#pragma once
#include "ThermoConstants.h"
#include <cstdint>
#include <string>

// Tunables for the thermodynamics pass. Kept separate from Config so the
// engine can be built without the rules-file loader.
struct ThermoTuning {
    double tickSeconds = ThermoConstants::DEFAULT_TICK_SECONDS;
    double pressureScale = 50.0;          // Hydrostatic pressure multiplier
    double radiationScale = 1.0;
    double ambientRelaxRate = 2.0;        // Air relaxation toward ambient, per second
    double conductionStability = 0.2;     // Max share of the equalizing energy moved per face per tick
    double boilVentMaxFraction = 0.02;    // Max share of a boiling cell's mass vented per tick
    double boilMinMassFraction = 0.05;    // Below this share of a full cell the liquid flashes to vapor
    double gasFlowThresholdPa = 500.0;
    double gasFlowMaxFraction = 0.25;
};

struct Config {
    // World
    int worldWidth;
    int worldHeight;
    int viewScale;
    uint64_t seed;

    // Timing
    double tickRateHz;
    int maxStepsPerFrame;
    double maxFrameSeconds;

    // Brushes
    int brushRadius;
    double temperatureBrushC;

    // Ambient conditions
    double ambientTemperatureC;
    double ambientPressurePa;

    // Files
    std::string fontPath;
    std::string sceneImage;
    std::string logFile;
    std::string logLevel;

    ThermoTuning thermo;

    Config();
    bool loadFromFile(const std::string& filename);

    // Clamp out-of-range values. Returns the number of corrections made.
    int validate();

private:
    void setDefaults();
    void parseLine(const std::string& line);
};
