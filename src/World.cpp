#include "World.h"
#include "DebugLog.h"
#include "Heatmap.h"
#include "SimulationError.h"
#include "Thermo.h"
#include <algorithm>
#include <sstream>
#include <string>

namespace {

bool acceptsGasOrLiquid(MaterialType target) {
    return Materials::isGas(target) || Materials::isLiquid(target);
}

bool acceptsGas(MaterialType target) {
    return Materials::isGas(target);
}

bool acceptsAir(MaterialType target) {
    return target == MaterialType::AIR;
}

} // namespace

World::World(int width, int height, uint64_t seed, const ThermoTuning& tuning)
    : gridWidth(width), gridHeight(height), thermo(tuning), rng(seed) {
    if (width <= 0 || height <= 0) {
        throw InvalidDimension("World dimensions must be positive, got " +
                               std::to_string(width) + "x" + std::to_string(height));
    }

    size_t n = static_cast<size_t>(width) * static_cast<size_t>(height);
    cells.assign(n, MaterialType::AIR);
    energy.assign(n, 0.0);
    energyBack.assign(n, 0.0);
    mass.assign(n, 0.0);
    pressure.assign(n, ambientPressurePa);
    tempK.assign(n, 0.0);
    movedStamp.assign(n, 0);
    gasFlowStamp.assign(n, 0);

    clear();
}

void World::reseed(uint64_t seed) {
    rng.seed(seed);
    coin.reset();
    if (debugLog) debugLog->info("World reseeded with " + std::to_string(seed));
}

bool World::inBounds(int x, int y) const {
    return x >= 0 && x < gridWidth && y >= 0 && y < gridHeight;
}

void World::setDebugLog(DebugLog* log) {
    debugLog = log;
    if (debugLog) {
        std::ostringstream oss;
        oss << "World attached: " << gridWidth << "x" << gridHeight
            << " ambient " << ambientTempC << " C / " << ambientPressurePa << " Pa";
        debugLog->info(oss.str());
    }
}

void World::requireDefined(MaterialType type, const char* operation) const {
    if (!Materials::isDefined(type)) {
        throw InvalidArgument(std::string(operation) + ": undefined material id " +
                              std::to_string(static_cast<int>(type)));
    }
}

// ============== CELL STATE HELPERS ==============

double World::ambientAirMass() const {
    return Thermo::massForPressureTemperature(MaterialType::AIR, ambientPressurePa, ambientTempC);
}

double World::cellTemperatureC(int i) const {
    return Thermo::temperatureC(cells[i], energy[i], mass[i], pressure[i]);
}

void World::placeFreshCell(int i, MaterialType type, double tempC) {
    double t = Thermo::clampTempC(tempC);
    cells[i] = type;
    pressure[i] = ambientPressurePa;
    if (Materials::isGas(type)) {
        mass[i] = Thermo::massForPressureTemperature(type, ambientPressurePa, t);
    } else {
        mass[i] = Materials::condensedCellMassKg(type);
    }
    energy[i] = Thermo::energyForTemperature(type, t, mass[i], pressure[i]);
}

// Temperature edit. Mass is kept unless the edit crosses between vapor and
// condensed matter: boiled cells become vapor at the cell's pressure, and
// vapor condenses into a full cell only when it holds that much mass.
void World::applyTemperature(int i, double tempC) {
    double t = Thermo::clampTempC(tempC);
    MaterialType type = cells[i];
    energy[i] = Thermo::energyForTemperature(type, t, mass[i], pressure[i]);

    MaterialType next = type;
    const MaterialDefinition& def = Materials::lookup(type);
    if (!def.phaseLocked && type != MaterialType::AIR) {
        next = Thermo::updatePhase(type, energy[i], mass[i], pressure[i]);
    }

    bool wasGas = Materials::isGas(type);
    if (wasGas && !Materials::isGas(next)) {
        double full = Materials::condensedCellMassKg(next);
        if (mass[i] < full) next = type;
        else mass[i] = full;
    }
    cells[i] = next;

    if (Materials::isGas(next)) {
        if (!wasGas) mass[i] = Thermo::massForPressureTemperature(next, pressure[i], t);
        pressure[i] = Thermo::pressureForMassTemperature(next, mass[i], t);
        energy[i] = Thermo::energyForTemperature(next, t, mass[i], pressure[i]);
    } else if (next != type) {
        energy[i] = Thermo::energyForTemperature(next, t, mass[i], pressure[i]);
    }
}

template <typename Fn>
void World::forEachCellInDisc(int cx, int cy, int radius, Fn fn) {
    if (radius < 0) return;

    // 64-bit: with |dx|, |dy| <= radius the squared distance stays below 2^63
    int64_t r = radius;
    int64_t x0 = static_cast<int64_t>(cx) - r;
    int64_t x1 = static_cast<int64_t>(cx) + r;
    int64_t y0 = static_cast<int64_t>(cy) - r;
    int64_t y1 = static_cast<int64_t>(cy) + r;
    if (x1 < 0 || y1 < 0 || x0 >= gridWidth || y0 >= gridHeight) return;

    int minX = static_cast<int>(std::max<int64_t>(x0, 0));
    int maxX = static_cast<int>(std::min<int64_t>(x1, gridWidth - 1));
    int minY = static_cast<int>(std::max<int64_t>(y0, 0));
    int maxY = static_cast<int>(std::min<int64_t>(y1, gridHeight - 1));
    int64_t r2 = r * r;

    for (int y = minY; y <= maxY; ++y) {
        int64_t dy = y - static_cast<int64_t>(cy);
        for (int x = minX; x <= maxX; ++x) {
            int64_t dx = x - static_cast<int64_t>(cx);
            if (dx * dx + dy * dy <= r2) fn(index(x, y));
        }
    }
}

// ============== MUTATORS ==============

void World::setCell(int x, int y, MaterialType type) {
    requireDefined(type, "setCell");
    if (!inBounds(x, y)) return;
    placeFreshCell(index(x, y), type, ambientTempC);
}

void World::clear() {
    for (int i = 0; i < cellCount(); ++i) {
        placeFreshCell(i, MaterialType::AIR, ambientTempC);
    }
}

void World::fillBorder(MaterialType type) {
    requireDefined(type, "fillBorder");

    // top and bottom
    for (int x = 0; x < gridWidth; ++x) {
        placeFreshCell(index(x, 0), type, ambientTempC);
        placeFreshCell(index(x, gridHeight - 1), type, ambientTempC);
    }
    // left and right
    for (int y = 0; y < gridHeight; ++y) {
        placeFreshCell(index(0, y), type, ambientTempC);
        placeFreshCell(index(gridWidth - 1, y), type, ambientTempC);
    }
}

void World::paintCircle(int cx, int cy, int radius, MaterialType type) {
    requireDefined(type, "paintCircle");
    forEachCellInDisc(cx, cy, radius, [&](int i) {
        placeFreshCell(i, type, ambientTempC);
    });
}

void World::paintCircleWithTemperature(int cx, int cy, int radius, MaterialType type, double tempC) {
    requireDefined(type, "paintCircleWithTemperature");

    double t = Thermo::clampTempC(tempC);
    forEachCellInDisc(cx, cy, radius, [&](int i) {
        placeFreshCell(i, type, t);

        // Re-place as the derived phase so mass matches it (ideal gas or full cell)
        MaterialType derived = Thermo::updatePhase(type, energy[i], mass[i], pressure[i]);
        if (derived != type) placeFreshCell(i, derived, t);
    });
}

void World::paintTemperatureCircle(int cx, int cy, int radius, double tempC) {
    forEachCellInDisc(cx, cy, radius, [&](int i) {
        applyTemperature(i, tempC);
    });
}

void World::setTemperatureC(int x, int y, double tempC) {
    if (!inBounds(x, y)) return;
    applyTemperature(index(x, y), tempC);
}

void World::setAmbientTemperatureC(double tempC) {
    // Air cells drift toward the new value in relaxAmbientAir
    ambientTempC = Thermo::clampTempC(tempC);
}

void World::setAmbientPressurePa(double pressurePa) {
    ambientPressurePa = std::clamp(pressurePa, ThermoConstants::MIN_PRESSURE_PA,
                                   ThermoConstants::MAX_PRESSURE_PA);

    for (int i = 0; i < cellCount(); ++i) {
        if (cells[i] != MaterialType::AIR) continue;
        double t = cellTemperatureC(i);
        mass[i] = Thermo::massForPressureTemperature(MaterialType::AIR, ambientPressurePa, t);
        pressure[i] = ambientPressurePa;
        energy[i] = Thermo::energyForTemperature(MaterialType::AIR, t, mass[i], pressure[i]);
    }
}

// ============== ACCESSORS ==============

MaterialType World::materialAt(int x, int y) const {
    if (!inBounds(x, y)) return MaterialType::BEDROCK;
    return cells[index(x, y)];
}

double World::temperatureAt(int x, int y) const {
    if (!inBounds(x, y)) return ambientTempC;
    return cellTemperatureC(index(x, y));
}

double World::energyAt(int x, int y) const {
    if (!inBounds(x, y)) return 0.0;
    return energy[index(x, y)];
}

double World::massAt(int x, int y) const {
    if (!inBounds(x, y)) return 0.0;
    return mass[index(x, y)];
}

double World::pressureAt(int x, int y) const {
    if (!inBounds(x, y)) return ambientPressurePa;
    return pressure[index(x, y)];
}

int World::countMaterial(MaterialType type) const {
    return static_cast<int>(std::count(cells.begin(), cells.end(), type));
}

void World::renderMaterialsTo(std::vector<uint32_t>& pixels) const {
    if (pixels.size() < cells.size()) {
        throw InvalidArgument("renderMaterialsTo: buffer holds " + std::to_string(pixels.size()) +
                              " pixels, need " + std::to_string(cells.size()));
    }
    #pragma omp parallel for schedule(static)
    for (int i = 0; i < cellCount(); ++i) {
        pixels[i] = Materials::lookup(cells[i]).argb;
    }
}

void World::renderTemperatureHeatmapTo(std::vector<uint32_t>& pixels) const {
    if (pixels.size() < cells.size()) {
        throw InvalidArgument("renderTemperatureHeatmapTo: buffer holds " + std::to_string(pixels.size()) +
                              " pixels, need " + std::to_string(cells.size()));
    }
    #pragma omp parallel for schedule(static)
    for (int i = 0; i < cellCount(); ++i) {
        pixels[i] = heatmapColor(cellTemperatureC(i));
    }
}

// ============== SIMULATION ==============

void World::step() {
    ++currentTick;
    lastStats = TickStats();

    movementPass();
    thermodynamicsPass();
    logTickSummary();
}

void World::movementPass() {
    // Random starting direction each tick, alternating per row
    bool leftToRight = randomBool();

    for (int y = gridHeight - 2; y >= 1; --y) {
        if (leftToRight) {
            for (int x = 1; x < gridWidth - 1; ++x) {
                int i = index(x, y);
                if (movedStamp[i] == currentTick) continue;
                MaterialType type = cells[i];
                if (Materials::lookup(type).immobile || type == MaterialType::AIR) continue;

                if (Materials::isFloatingSolid(type)) updateFloatingSolid(x, y);
                else if (Materials::isGranular(type)) updateGranular(x, y);
                else if (Materials::isLiquid(type)) updateLiquid(x, y);
                else if (Materials::isGas(type)) updateGas(x, y);
            }
        } else {
            for (int x = gridWidth - 2; x >= 1; --x) {
                int i = index(x, y);
                if (movedStamp[i] == currentTick) continue;
                MaterialType type = cells[i];
                if (Materials::lookup(type).immobile || type == MaterialType::AIR) continue;

                if (Materials::isFloatingSolid(type)) updateFloatingSolid(x, y);
                else if (Materials::isGranular(type)) updateGranular(x, y);
                else if (Materials::isLiquid(type)) updateLiquid(x, y);
                else if (Materials::isGas(type)) updateGas(x, y);
            }
        }
        leftToRight = !leftToRight;
    }
}

bool World::tryMove(int x, int y, int nx, int ny, bool (*accepts)(MaterialType)) {
    if (!inBounds(nx, ny)) return false;
    int target = index(nx, ny);
    if (!accepts(cells[target])) return false;
    swapCells(index(x, y), target);
    return true;
}

void World::updateGranular(int x, int y) {
    if (tryMove(x, y, x, y + 1, acceptsGasOrLiquid)) return;

    if (randomBool()) {
        if (!tryMove(x, y, x - 1, y + 1, acceptsGasOrLiquid)) tryMove(x, y, x + 1, y + 1, acceptsGasOrLiquid);
    } else {
        if (!tryMove(x, y, x + 1, y + 1, acceptsGasOrLiquid)) tryMove(x, y, x - 1, y + 1, acceptsGasOrLiquid);
    }
}

void World::updateLiquid(int x, int y) {
    // Sand resting on a liquid holds it in place
    if (Materials::isGranular(materialAt(x, y - 1))) return;

    if (tryMove(x, y, x, y + 1, acceptsGas)) return;

    if (randomBool()) {
        if (tryMove(x, y, x - 1, y + 1, acceptsGas)) return;
        if (tryMove(x, y, x + 1, y + 1, acceptsGas)) return;
    } else {
        if (tryMove(x, y, x + 1, y + 1, acceptsGas)) return;
        if (tryMove(x, y, x - 1, y + 1, acceptsGas)) return;
    }

    // Spread sideways (1 cell per tick)
    if (randomBool()) {
        if (!tryMove(x, y, x - 1, y, acceptsGas)) tryMove(x, y, x + 1, y, acceptsGas);
    } else {
        if (!tryMove(x, y, x + 1, y, acceptsGas)) tryMove(x, y, x - 1, y, acceptsGas);
    }
}

void World::updateGas(int x, int y) {
    if (tryMove(x, y, x, y - 1, acceptsAir)) return;

    if (randomBool()) {
        if (tryMove(x, y, x - 1, y - 1, acceptsAir)) return;
        if (tryMove(x, y, x + 1, y - 1, acceptsAir)) return;
    } else {
        if (tryMove(x, y, x + 1, y - 1, acceptsAir)) return;
        if (tryMove(x, y, x - 1, y - 1, acceptsAir)) return;
    }

    if (randomBool()) {
        if (!tryMove(x, y, x - 1, y, acceptsAir)) tryMove(x, y, x + 1, y, acceptsAir);
    } else {
        if (!tryMove(x, y, x + 1, y, acceptsAir)) tryMove(x, y, x - 1, y, acceptsAir);
    }
}

void World::updateFloatingSolid(int x, int y) {
    MaterialType self = cells[index(x, y)];
    MaterialType above = materialAt(x, y - 1);
    if (Materials::isLiquid(above) &&
        Materials::lookup(above).densityKgM3 > Materials::lookup(self).densityKgM3) {
        swapCells(index(x, y), index(x, y - 1));
        return;
    }

    if (tryMove(x, y, x, y + 1, acceptsGas)) return;

    if (randomBool()) {
        if (!tryMove(x, y, x - 1, y + 1, acceptsGas)) tryMove(x, y, x + 1, y + 1, acceptsGas);
    } else {
        if (!tryMove(x, y, x + 1, y + 1, acceptsGas)) tryMove(x, y, x - 1, y + 1, acceptsGas);
    }
}

// Identity and thermodynamic state always travel together.
void World::swapCells(int a, int b) {
    std::swap(cells[a], cells[b]);
    std::swap(energy[a], energy[b]);
    std::swap(mass[a], mass[b]);
    std::swap(pressure[a], pressure[b]);

    movedStamp[a] = currentTick;
    movedStamp[b] = currentTick;
    ++lastStats.swaps;
}

void World::logTickSummary() {
    if (!debugLog || !debugLog->enabled(DebugLog::Level::Debug)) return;
    if (lastStats.swaps == 0 && lastStats.phaseChanges == 0 && lastStats.gasTransfers == 0 &&
        lastStats.ventedKg == 0.0) {
        return;
    }

    std::ostringstream oss;
    oss << "tick " << currentTick
        << " swaps=" << lastStats.swaps
        << " phase=" << lastStats.phaseChanges
        << " ventedKg=" << lastStats.ventedKg
        << " gasTransfers=" << lastStats.gasTransfers;
    debugLog->debug(oss.str());
}
