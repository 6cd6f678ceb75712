#pragma once
#include "Material.h"
#include "Config.h"
#include "ThermoConstants.h"
#include <cstdint>
#include <random>
#include <vector>

class DebugLog;

// Counters for the most recent step()
struct TickStats {
    int swaps = 0;
    int phaseChanges = 0;
    double ventedKg = 0.0;
    int gasTransfers = 0;
};

// Fixed-size grid of material cells. Each cell stores its material id plus
// energy (J, from absolute zero), mass (kg) and pressure (Pa). Temperature
// and phase are derived from energy through the Thermo model.
//
// The outer ring is never scanned by the movement pass; keep it filled with
// an immobile material (fillBorder). Out-of-bounds reads behave like bedrock
// at ambient conditions.
class World {
public:
    World(int width, int height, uint64_t seed, const ThermoTuning& tuning = ThermoTuning());

    // Restart the movement tie-break stream without touching the grid.
    void reseed(uint64_t seed);

    int width() const { return gridWidth; }
    int height() const { return gridHeight; }
    int cellCount() const { return gridWidth * gridHeight; }
    uint64_t tickId() const { return currentTick; }
    bool inBounds(int x, int y) const;

    // Advance one tick: movement pass, then thermodynamics pass. Never throws.
    void step();

    // Mutators. Throw InvalidArgument for unregistered material ids;
    // out-of-range coordinates are ignored or clamped.
    void setCell(int x, int y, MaterialType type);
    void clear();
    void fillBorder(MaterialType type);
    void paintCircle(int cx, int cy, int radius, MaterialType type);
    void paintCircleWithTemperature(int cx, int cy, int radius, MaterialType type, double tempC);
    void paintTemperatureCircle(int cx, int cy, int radius, double tempC);
    void setTemperatureC(int x, int y, double tempC);
    void setAmbientTemperatureC(double tempC);
    void setAmbientPressurePa(double pressurePa);

    // Accessors
    MaterialType materialAt(int x, int y) const;
    double temperatureAt(int x, int y) const;
    double energyAt(int x, int y) const;
    double massAt(int x, int y) const;
    double pressureAt(int x, int y) const;
    double ambientTemperature() const { return ambientTempC; }
    double ambientPressure() const { return ambientPressurePa; }
    int countMaterial(MaterialType type) const;
    const TickStats& lastTickStats() const { return lastStats; }
    const ThermoTuning& tuning() const { return thermo; }

    // Fill 'pixels' (ARGB8888, row-major, at least width*height entries).
    void renderMaterialsTo(std::vector<uint32_t>& pixels) const;
    void renderTemperatureHeatmapTo(std::vector<uint32_t>& pixels) const;

    // Optional; not owned. Pass nullptr to detach.
    void setDebugLog(DebugLog* log);

private:
    friend class WorldInspector;

    int gridWidth;
    int gridHeight;
    ThermoTuning thermo;

    double ambientTempC = ThermoConstants::DEFAULT_AMBIENT_TEMP_C;
    double ambientPressurePa = ThermoConstants::DEFAULT_AMBIENT_PRESSURE_PA;

    // Per-cell state, index = x + y * width
    std::vector<MaterialType> cells;
    std::vector<double> energy;
    std::vector<double> energyBack;   // Conduction write buffer
    std::vector<double> mass;
    std::vector<double> pressure;
    std::vector<double> tempK;        // Temperature snapshot for the current sub-step
    std::vector<uint64_t> movedStamp;
    std::vector<uint64_t> gasFlowStamp;

    uint64_t currentTick = 1;
    std::mt19937_64 rng;
    std::bernoulli_distribution coin{0.5};

    DebugLog* debugLog = nullptr;
    TickStats lastStats;

    int index(int x, int y) const { return x + y * gridWidth; }
    bool randomBool() { return coin(rng); }
    void requireDefined(MaterialType type, const char* operation) const;

    // Calls fn(index) for every in-grid cell within radius of (cx, cy)
    template <typename Fn>
    void forEachCellInDisc(int cx, int cy, int radius, Fn fn);

    // Cell construction helpers
    void placeFreshCell(int i, MaterialType type, double tempC);
    void applyTemperature(int i, double tempC);
    double cellTemperatureC(int i) const;
    double ambientAirMass() const;

    // Movement pass
    void movementPass();
    void updateGranular(int x, int y);
    void updateLiquid(int x, int y);
    void updateGas(int x, int y);
    void updateFloatingSolid(int x, int y);
    bool tryMove(int x, int y, int nx, int ny, bool (*accepts)(MaterialType));
    void swapCells(int a, int b);

    // Thermodynamics pass (WorldThermodynamics.cpp)
    void thermodynamicsPass();
    void snapshotTemperatures();
    void refreshGasPressure(int i);
    void recomputePressure();
    void conduct();
    void couple(int a, int b);
    void relaxAmbientAir();
    void radiate();
    void updatePhases();
    void ventBoilingLiquids();
    void ventCell(int i);
    bool condenseVapor(int i, MaterialType condensed);
    int findVaporTarget(int i, MaterialFamily family) const;
    void depositVapor(int target, MaterialType gas, double dm, double dE, double pressurePa);
    void diffuseGas();
    void flowGas(int from, int to);
    void revertToAmbientAir(int i);
    void logTickSummary();
};
