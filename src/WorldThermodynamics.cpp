#include "World.h"
#include "Thermo.h"
#include <algorithm>
#include <cmath>

using namespace ThermoConstants;

// Sub-steps run in a fixed order. Each one that needs temperatures takes a
// fresh snapshot first, so cells never see a half-updated neighbour.
void World::thermodynamicsPass() {
    recomputePressure();
    conduct();
    relaxAmbientAir();
    radiate();
    updatePhases();
    ventBoilingLiquids();
    diffuseGas();
}

void World::snapshotTemperatures() {
    for (int i = 0; i < cellCount(); ++i) {
        tempK[i] = Thermo::celsiusToKelvin(cellTemperatureC(i));
    }
}

void World::refreshGasPressure(int i) {
    double tC = cellTemperatureC(i);
    pressure[i] = Thermo::pressureForMassTemperature(cells[i], mass[i], tC);
}

// ============== PRESSURE ==============

void World::recomputePressure() {
    snapshotTemperatures();

    double columnStep = GRAVITY_M_S2 / CELL_FACE_AREA_M2 * thermo.pressureScale;

    for (int x = 0; x < gridWidth; ++x) {
        double running = ambientPressurePa;
        for (int y = 0; y < gridHeight; ++y) {
            int i = index(x, y);
            MaterialType type = cells[i];
            const MaterialDefinition& def = Materials::lookup(type);

            if (def.phase == Phase::GAS) {
                pressure[i] = Thermo::pressureForMassTemperature(type, mass[i], Thermo::kelvinToCelsius(tempK[i]));
                running = pressure[i];
            } else if (def.immobile) {
                // Fixed terrain carries the load; the column restarts below it
                pressure[i] = ambientPressurePa;
                running = ambientPressurePa;
            } else {
                running = std::min(running + mass[i] * columnStep, MAX_PRESSURE_PA);
                pressure[i] = running;
            }
        }
    }
}

// ============== CONDUCTION ==============

void World::conduct() {
    snapshotTemperatures();
    std::copy(energy.begin(), energy.end(), energyBack.begin());

    for (int y = 0; y < gridHeight; ++y) {
        for (int x = 0; x < gridWidth; ++x) {
            int i = index(x, y);
            if (x + 1 < gridWidth) couple(i, i + 1);
            if (y + 1 < gridHeight) couple(i, i + gridWidth);
        }
    }

    for (double& e : energyBack) {
        if (!(e >= 0.0)) e = 0.0;
    }
    std::swap(energy, energyBack);
}

void World::couple(int a, int b) {
    const MaterialDefinition& da = Materials::lookup(cells[a]);
    const MaterialDefinition& db = Materials::lookup(cells[b]);

    double kSum = da.conductivityWMK + db.conductivityWMK;
    if (kSum <= 0.0) return;
    double kEff = 2.0 * da.conductivityWMK * db.conductivityWMK / kSum;
    if (kEff <= 0.0) return;

    double dT = tempK[a] - tempK[b];
    if (dT == 0.0) return;

    double ca = Thermo::sensibleHeatCapacity(cells[a], mass[a]);
    double cb = Thermo::sensibleHeatCapacity(cells[b], mass[b]);
    if (ca <= 0.0 || cb <= 0.0) return;

    // Positive q flows from a to b
    double q = kEff * CELL_SIZE_M * dT * thermo.tickSeconds;
    double cap = thermo.conductionStability * std::abs(dT) * ca * cb / (ca + cb);
    q = std::clamp(q, -cap, cap);

    energyBack[a] -= q;
    energyBack[b] += q;
}

// ============== AMBIENT AIR ==============

void World::relaxAmbientAir() {
    double airMass = ambientAirMass();
    double blend = 1.0 - std::exp(-thermo.ambientRelaxRate * thermo.tickSeconds);

    for (int i = 0; i < cellCount(); ++i) {
        if (cells[i] != MaterialType::AIR) continue;

        double t = cellTemperatureC(i);
        mass[i] = airMass;
        pressure[i] = ambientPressurePa;
        double current = Thermo::energyForTemperature(MaterialType::AIR, t, airMass, ambientPressurePa);
        double target = Thermo::energyForTemperature(MaterialType::AIR, ambientTempC, airMass, ambientPressurePa);
        energy[i] = current + (target - current) * blend;
    }
}

// ============== RADIATION ==============

void World::radiate() {
    snapshotTemperatures();

    double ambientK = Thermo::celsiusToKelvin(ambientTempC);
    double ambientK4 = ambientK * ambientK * ambientK * ambientK;
    double visibleK = Thermo::celsiusToKelvin(RADIATION_VISIBLE_START_C);

    static const int DX[4] = {0, -1, 1, 0};
    static const int DY[4] = {-1, 0, 0, 1};

    for (int y = 0; y < gridHeight; ++y) {
        for (int x = 0; x < gridWidth; ++x) {
            int i = index(x, y);
            const MaterialDefinition& def = Materials::lookup(cells[i]);
            if (def.phase == Phase::GAS || def.emissivity <= 0.0) continue;

            double tK = tempK[i];
            if (tK <= visibleK) continue;

            int exposed = 0;
            for (int d = 0; d < 4; ++d) {
                int nx = x + DX[d];
                int ny = y + DY[d];
                if (inBounds(nx, ny) && Materials::isGas(cells[index(nx, ny)])) ++exposed;
            }
            if (exposed == 0) continue;

            double tK4 = tK * tK * tK * tK;
            double loss = def.emissivity * STEFAN_BOLTZMANN * exposed * CELL_FACE_AREA_M2 *
                          (tK4 - ambientK4) * thermo.radiationScale * thermo.tickSeconds;
            if (loss <= 0.0) continue;

            // Never radiate below ambient
            double floor = Thermo::energyForTemperature(cells[i], ambientTempC, mass[i], pressure[i]);
            double headroom = energy[i] - floor;
            if (headroom <= 0.0) continue;
            energy[i] -= std::min(loss, headroom);
        }
    }
}

// ============== PHASE ==============

void World::updatePhases() {
    for (int i = 0; i < cellCount(); ++i) {
        MaterialType type = cells[i];
        if (type == MaterialType::AIR || Materials::lookup(type).phaseLocked) continue;

        MaterialType next = Thermo::updatePhase(type, energy[i], mass[i], pressure[i]);
        if (next == type) continue;
        if (Materials::isGas(type) && !Materials::isGas(next) && !condenseVapor(i, next)) continue;

        cells[i] = next;
        ++lastStats.phaseChanges;
        if (Materials::isGas(next)) refreshGasPressure(i);
    }
}

// Vapor turns into a condensed cell only once it holds a full cell of that
// phase. The surplus stays vapor and moves to an open neighbour; with no room
// the cell waits as vapor.
bool World::condenseVapor(int i, MaterialType condensed) {
    double full = Materials::condensedCellMassKg(condensed);
    if (mass[i] < full) return false;

    double surplus = mass[i] - full;
    if (surplus < GAS_REVERT_MASS_KG) return true;

    int target = findVaporTarget(i, Materials::lookup(condensed).family);
    if (target < 0) return false;

    double dE = energy[i] * surplus / mass[i];
    depositVapor(target, cells[i], surplus, dE, pressure[i]);
    mass[i] = full;
    energy[i] = std::max(energy[i] - dE, 0.0);
    return true;
}

// ============== BOILING ==============

void World::ventBoilingLiquids() {
    for (int i = 0; i < cellCount(); ++i) {
        MaterialType type = cells[i];
        if (!Materials::isLiquid(type) || Materials::lookup(type).phaseLocked) continue;

        Thermo::PhaseBands b = Thermo::bands(Materials::lookup(type).family, mass[i], pressure[i]);
        if (energy[i] < b.boilStart) continue;
        ventCell(i);
    }
}

void World::ventCell(int i) {
    const MaterialDefinition& def = Materials::lookup(cells[i]);
    const FamilyDefinition& fam = Materials::family(def.family);
    if (fam.latentVaporJKg <= 0.0 || mass[i] <= 0.0) return;

    Thermo::PhaseBands b = Thermo::bands(def.family, mass[i], pressure[i]);
    double excess = energy[i] - b.boilStart;
    double dm = std::min(excess / fam.latentVaporJKg, mass[i] * thermo.boilVentMaxFraction);
    if (!(dm > 0.0)) return;

    // Vapor leaves fully boiled, at the end of the plateau
    double dE = dm * b.boilEnd / mass[i];

    int target = findVaporTarget(i, def.family);
    if (target < 0) return;
    depositVapor(target, fam.gas, dm, dE, pressure[i]);

    mass[i] -= dm;
    energy[i] = std::max(energy[i] - dE, 0.0);
    lastStats.ventedKg += dm;

    if (mass[i] < thermo.boilMinMassFraction * Materials::condensedCellMassKg(cells[i])) {
        cells[i] = fam.gas;
        ++lastStats.phaseChanges;
        refreshGasPressure(i);
    }
}

// Open neighbour for vapor leaving cell i: air or same-family gas, tried
// up, left, right, then down. Returns -1 when boxed in.
int World::findVaporTarget(int i, MaterialFamily family) const {
    int x = i % gridWidth;
    int y = i / gridWidth;
    static const int DX[4] = {0, -1, 1, 0};
    static const int DY[4] = {-1, 0, 0, 1};

    for (int d = 0; d < 4; ++d) {
        int nx = x + DX[d];
        int ny = y + DY[d];
        if (!inBounds(nx, ny)) continue;
        int j = index(nx, ny);
        MaterialType other = cells[j];
        if (other == MaterialType::AIR ||
            (Materials::isGas(other) && Materials::lookup(other).family == family)) {
            return j;
        }
    }
    return -1;
}

void World::depositVapor(int target, MaterialType gas, double dm, double dE, double pressurePa) {
    if (cells[target] == MaterialType::AIR) {
        // Displaced air returns to the ambient reservoir
        cells[target] = gas;
        mass[target] = dm;
        energy[target] = dE;
        pressure[target] = pressurePa;
    } else {
        mass[target] += dm;
        energy[target] += dE;
    }
    refreshGasPressure(target);
}

// ============== GAS DIFFUSION ==============

void World::diffuseGas() {
    static const int DX[4] = {-1, 1, 0, 0};
    static const int DY[4] = {0, 0, -1, 1};

    for (int y = 0; y < gridHeight; ++y) {
        for (int x = 0; x < gridWidth; ++x) {
            int i = index(x, y);
            if (gasFlowStamp[i] == currentTick) continue;

            for (int d = 0; d < 4; ++d) {
                MaterialType type = cells[i];
                if (type == MaterialType::AIR || !Materials::isGas(type)) break;

                int nx = x + DX[d];
                int ny = y + DY[d];
                if (!inBounds(nx, ny)) continue;
                int j = index(nx, ny);

                MaterialType other = cells[j];
                bool open = other == MaterialType::AIR ||
                            (Materials::isGas(other) &&
                             Materials::lookup(other).family == Materials::lookup(type).family);
                if (!open) continue;

                if (pressure[i] - pressure[j] > thermo.gasFlowThresholdPa) {
                    flowGas(i, j);
                }
            }
        }
    }
}

void World::flowGas(int from, int to) {
    double pFrom = pressure[from];
    if (pFrom <= 0.0) return;

    double dp = pFrom - pressure[to];
    double fraction = std::min(thermo.gasFlowMaxFraction, 0.5 * dp / pFrom);
    if (!(fraction > 0.0)) return;

    double dm = mass[from] * fraction;
    double dE = energy[from] * fraction;

    if (cells[to] == MaterialType::AIR) {
        // Displaced air returns to the ambient reservoir
        cells[to] = cells[from];
        mass[to] = dm;
        energy[to] = dE;
        pressure[to] = pFrom;
    } else {
        mass[to] += dm;
        energy[to] += dE;
    }
    mass[from] -= dm;
    energy[from] -= dE;

    refreshGasPressure(to);
    refreshGasPressure(from);

    gasFlowStamp[to] = currentTick;
    ++lastStats.gasTransfers;

    if (mass[from] < GAS_REVERT_MASS_KG) {
        revertToAmbientAir(from);
    }
}

void World::revertToAmbientAir(int i) {
    placeFreshCell(i, MaterialType::AIR, ambientTempC);
}
