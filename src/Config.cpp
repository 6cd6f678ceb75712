#include "Config.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iostream>

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    worldWidth = 320;
    worldHeight = 200;
    viewScale = 3;
    seed = 1;

    tickRateHz = 60.0;
    maxStepsPerFrame = 4;
    maxFrameSeconds = 0.25;

    brushRadius = 4;
    temperatureBrushC = ThermoConstants::DEFAULT_AMBIENT_TEMP_C;

    ambientTemperatureC = ThermoConstants::DEFAULT_AMBIENT_TEMP_C;
    ambientPressurePa = ThermoConstants::DEFAULT_AMBIENT_PRESSURE_PA;

    fontPath = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
    sceneImage = "";
    logFile = "thermosand.log";
    logLevel = "info";

    thermo = ThermoTuning();
    thermo.tickSeconds = 1.0 / tickRateHz;
}

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Warning: Could not open " << filename << ", using defaults\n";
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        parseLine(line);
    }

    file.close();
    validate();
    return true;
}

void Config::parseLine(const std::string& line) {
    if (line.empty() || line[0] == '#') return;

    std::istringstream iss(line);
    std::string key, equals;

    if (!(iss >> key >> equals)) return;
    if (equals != "=") return;

    // World
    if (key == "world_width") iss >> worldWidth;
    else if (key == "world_height") iss >> worldHeight;
    else if (key == "view_scale") iss >> viewScale;
    else if (key == "seed") iss >> seed;
    // Timing
    else if (key == "tick_rate_hz") iss >> tickRateHz;
    else if (key == "max_steps_per_frame") iss >> maxStepsPerFrame;
    else if (key == "max_frame_seconds") iss >> maxFrameSeconds;
    // Brushes
    else if (key == "brush_radius") iss >> brushRadius;
    else if (key == "temperature_brush_c") iss >> temperatureBrushC;
    // Ambient
    else if (key == "ambient_temperature_c") iss >> ambientTemperatureC;
    else if (key == "ambient_pressure_pa") iss >> ambientPressurePa;
    // Files (rest of line, so paths may contain spaces)
    else if (key == "font_path" || key == "scene_image" || key == "log_file") {
        std::string value;
        std::getline(iss >> std::ws, value);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\r')) value.pop_back();
        if (key == "font_path") fontPath = value;
        else if (key == "scene_image") sceneImage = value;
        else logFile = value;
    }
    else if (key == "log_level") iss >> logLevel;
    // Thermodynamics tuning
    else if (key == "pressure_scale") iss >> thermo.pressureScale;
    else if (key == "radiation_scale") iss >> thermo.radiationScale;
    else if (key == "ambient_relax_rate") iss >> thermo.ambientRelaxRate;
    else if (key == "conduction_stability") iss >> thermo.conductionStability;
    else if (key == "boil_vent_max_fraction") iss >> thermo.boilVentMaxFraction;
    else if (key == "boil_min_mass_fraction") iss >> thermo.boilMinMassFraction;
    else if (key == "gas_flow_threshold_pa") iss >> thermo.gasFlowThresholdPa;
    else if (key == "gas_flow_max_fraction") iss >> thermo.gasFlowMaxFraction;
}

namespace {

template <typename T>
void clampSetting(const char* name, T& value, T lo, T hi, int& corrections) {
    if (value < lo || value > hi) {
        T fixed = std::clamp(value, lo, hi);
        std::cerr << "Warning: " << name << " = " << value << " out of range, using " << fixed << "\n";
        value = fixed;
        ++corrections;
    }
}

} // namespace

int Config::validate() {
    using namespace ThermoConstants;
    int corrections = 0;

    clampSetting("world_width", worldWidth, 8, 4096, corrections);
    clampSetting("world_height", worldHeight, 8, 4096, corrections);
    clampSetting("view_scale", viewScale, 1, 16, corrections);
    clampSetting("tick_rate_hz", tickRateHz, 1.0, 1000.0, corrections);
    clampSetting("max_steps_per_frame", maxStepsPerFrame, 1, 64, corrections);
    clampSetting("max_frame_seconds", maxFrameSeconds, 0.001, 2.0, corrections);
    clampSetting("brush_radius", brushRadius, 0, 256, corrections);
    clampSetting("temperature_brush_c", temperatureBrushC, MIN_TEMP_C, MAX_TEMP_C, corrections);
    clampSetting("ambient_temperature_c", ambientTemperatureC, MIN_TEMP_C, MAX_TEMP_C, corrections);
    clampSetting("ambient_pressure_pa", ambientPressurePa, MIN_PRESSURE_PA, MAX_PRESSURE_PA, corrections);

    clampSetting("pressure_scale", thermo.pressureScale, 0.0, 1.0e6, corrections);
    clampSetting("radiation_scale", thermo.radiationScale, 0.0, 1.0e6, corrections);
    clampSetting("ambient_relax_rate", thermo.ambientRelaxRate, 0.0, 1.0e3, corrections);
    clampSetting("conduction_stability", thermo.conductionStability, 0.0, 0.5, corrections);
    clampSetting("boil_vent_max_fraction", thermo.boilVentMaxFraction, 0.0, 1.0, corrections);
    clampSetting("boil_min_mass_fraction", thermo.boilMinMassFraction, 0.0, 1.0, corrections);
    clampSetting("gas_flow_threshold_pa", thermo.gasFlowThresholdPa, 0.0, MAX_PRESSURE_PA, corrections);
    clampSetting("gas_flow_max_fraction", thermo.gasFlowMaxFraction, 0.0, 0.5, corrections);

    thermo.tickSeconds = 1.0 / tickRateHz;
    return corrections;
}
