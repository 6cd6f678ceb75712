#include <gtest/gtest.h>
#include "World.h"
#include "WorldInspector.h"
#include "Thermo.h"
#include <cmath>

using namespace ThermoConstants;

namespace {

const FamilyDefinition& waterFamily() {
    return Materials::family(MaterialFamily::WATER);
}

double waterFamilyMass(const World& world) {
    double total = 0.0;
    for (int y = 0; y < world.height(); ++y) {
        for (int x = 0; x < world.width(); ++x) {
            if (Materials::lookup(world.materialAt(x, y)).family == MaterialFamily::WATER) {
                total += world.massAt(x, y);
            }
        }
    }
    return total;
}

} // namespace

TEST(WorldPressure, HydrostaticPressureGrowsWithDepth) {
    World world(8, 10, 1);
    world.fillBorder(MaterialType::BEDROCK);
    for (int y = 3; y <= 8; ++y) {
        for (int x = 1; x <= 6; ++x) world.setCell(x, y, MaterialType::WATER);
    }

    world.step();

    EXPECT_GT(world.pressureAt(3, 3), world.ambientPressure());
    for (int y = 3; y < 8; ++y) {
        EXPECT_GT(world.pressureAt(3, y + 1), world.pressureAt(3, y)) << y;
    }
}

TEST(WorldPressure, ColumnRestartsBelowTerrain) {
    World world(6, 10, 1);
    world.fillBorder(MaterialType::BEDROCK);
    for (int x = 1; x <= 4; ++x) world.setCell(x, 7, MaterialType::STONE);
    world.setCell(2, 6, MaterialType::WATER);
    world.setCell(2, 8, MaterialType::SAND);

    world.step();

    double columnStep = GRAVITY_M_S2 / CELL_FACE_AREA_M2 * world.tuning().pressureScale;
    EXPECT_DOUBLE_EQ(world.pressureAt(2, 7), world.ambientPressure());
    EXPECT_DOUBLE_EQ(world.pressureAt(2, 8), world.ambientPressure() + world.massAt(2, 8) * columnStep);
}

TEST(WorldBoiling, BoilingWaterVentsSteamUpward) {
    World world(7, 6, 1);
    world.fillBorder(MaterialType::BEDROCK);
    for (int x = 1; x <= 5; ++x) world.setCell(x, 4, MaterialType::WATER);

    double m = world.massAt(3, 4);
    Thermo::PhaseBands b = Thermo::bands(MaterialFamily::WATER, m, world.pressureAt(3, 4));
    WorldInspector::setEnergy(world, 3, 4, b.boilStart + 0.3 * m * waterFamily().latentVaporJKg);

    world.step();

    EXPECT_EQ(world.materialAt(3, 4), MaterialType::WATER);
    EXPECT_EQ(world.materialAt(3, 3), MaterialType::STEAM);
    EXPECT_LT(world.massAt(3, 4), Materials::condensedCellMassKg(MaterialType::WATER));
    EXPECT_NEAR(world.lastTickStats().ventedKg, m * world.tuning().boilVentMaxFraction, 1e-12);
}

TEST(WorldBoiling, NearlyBoiledAwayCellFlashesToSteam) {
    World world(7, 6, 1);
    world.fillBorder(MaterialType::BEDROCK);
    for (int x = 1; x <= 5; ++x) world.setCell(x, 4, MaterialType::WATER);

    double m = 0.04 * Materials::condensedCellMassKg(MaterialType::WATER);
    WorldInspector::setMass(world, 3, 4, m);
    Thermo::PhaseBands b = Thermo::bands(MaterialFamily::WATER, m, world.pressureAt(3, 4));
    WorldInspector::setEnergy(world, 3, 4, b.boilStart + 0.5 * m * waterFamily().latentVaporJKg);

    world.step();

    EXPECT_EQ(world.materialAt(3, 4), MaterialType::STEAM);
    EXPECT_GE(world.lastTickStats().phaseChanges, 1);
}

TEST(WorldBoiling, CoolWaterDoesNotVent) {
    World world(7, 6, 1);
    world.fillBorder(MaterialType::BEDROCK);
    world.paintCircleWithTemperature(3, 4, 0, MaterialType::WATER, 95.0);

    world.step();

    EXPECT_EQ(world.lastTickStats().ventedKg, 0.0);
    EXPECT_EQ(world.countMaterial(MaterialType::STEAM), 0);
}

TEST(WorldCondensation, SparseVaporStaysVapor) {
    World world(9, 9, 1);
    world.fillBorder(MaterialType::BEDROCK);
    world.setCell(4, 4, MaterialType::STEAM);
    ASSERT_LT(world.massAt(4, 4), Materials::condensedCellMassKg(MaterialType::WATER));

    for (int i = 0; i < 3; ++i) {
        world.step();
        EXPECT_EQ(world.countMaterial(MaterialType::WATER), 0) << "tick " << i;
        EXPECT_EQ(world.countMaterial(MaterialType::STEAM), 1) << "tick " << i;
    }
}

TEST(WorldCondensation, DenseVaporCondensesIntoFullCell) {
    World world(7, 7, 1);
    world.fillBorder(MaterialType::BEDROCK);
    world.paintCircleWithTemperature(3, 4, 0, MaterialType::STEAM, 200.0);

    double full = Materials::condensedCellMassKg(MaterialType::WATER);
    double m = 1.5 * full;
    WorldInspector::setMass(world, 3, 4, m);
    WorldInspector::setEnergy(world, 3, 4,
                              Thermo::energyForTemperature(MaterialType::WATER, 50.0, m, world.ambientPressure()));
    WorldInspector::refreshGasPressure(world, 3, 4);
    double before = waterFamilyMass(world);

    world.step();

    ASSERT_EQ(world.countMaterial(MaterialType::WATER), 1);
    for (int y = 0; y < world.height(); ++y) {
        for (int x = 0; x < world.width(); ++x) {
            if (world.materialAt(x, y) == MaterialType::WATER) {
                EXPECT_DOUBLE_EQ(world.massAt(x, y), full);
            }
        }
    }
    // The surplus half cell is still vapor
    EXPECT_GE(world.countMaterial(MaterialType::STEAM), 1);
    EXPECT_NEAR(waterFamilyMass(world), before, 1e-15);
    EXPECT_GE(world.lastTickStats().phaseChanges, 1);
}

TEST(WorldCondensation, BoxedInVaporWaitsForRoom) {
    World world(3, 3, 1);
    world.fillBorder(MaterialType::BEDROCK);
    world.paintCircleWithTemperature(1, 1, 0, MaterialType::STEAM, 200.0);

    double m = 1.5 * Materials::condensedCellMassKg(MaterialType::WATER);
    WorldInspector::setMass(world, 1, 1, m);
    WorldInspector::setEnergy(world, 1, 1,
                              Thermo::energyForTemperature(MaterialType::WATER, 50.0, m, world.ambientPressure()));
    WorldInspector::refreshGasPressure(world, 1, 1);

    world.step();

    EXPECT_EQ(world.materialAt(1, 1), MaterialType::STEAM);
    EXPECT_DOUBLE_EQ(world.massAt(1, 1), m);
}

TEST(WorldRadiation, HotSurfacesLoseEnergyToOpenAir) {
    ThermoTuning dark;
    dark.radiationScale = 0.0;
    ThermoTuning bright;

    World quiet(9, 9, 1, dark);
    World glowing(9, 9, 1, bright);
    for (World* w : {&quiet, &glowing}) {
        w->fillBorder(MaterialType::BEDROCK);
        for (int y = 3; y <= 5; ++y) {
            for (int x = 3; x <= 5; ++x) {
                w->setCell(x, y, MaterialType::STONE);
                w->setTemperatureC(x, y, 1000.0);
            }
        }
        w->step();
    }

    // The core has no gas neighbours and only conduction touches it
    EXPECT_DOUBLE_EQ(quiet.energyAt(4, 4), glowing.energyAt(4, 4));
    EXPECT_LT(glowing.energyAt(4, 3), quiet.energyAt(4, 3));
    EXPECT_LT(glowing.energyAt(3, 3), quiet.energyAt(3, 3));
}

TEST(WorldRadiation, BelowVisibleHeatNothingRadiates) {
    ThermoTuning dark;
    dark.radiationScale = 0.0;

    World quiet(9, 9, 1, dark);
    World normal(9, 9, 1);
    for (World* w : {&quiet, &normal}) {
        w->fillBorder(MaterialType::BEDROCK);
        w->setCell(4, 4, MaterialType::STONE);
        w->setTemperatureC(4, 4, 500.0);
        w->step();
    }

    EXPECT_DOUBLE_EQ(quiet.energyAt(4, 4), normal.energyAt(4, 4));
}

TEST(WorldRadiation, NeverCoolsBelowAmbient) {
    ThermoTuning strong;
    strong.radiationScale = 1.0e6;

    World world(7, 7, 1, strong);
    world.fillBorder(MaterialType::BEDROCK);
    world.setCell(3, 3, MaterialType::STONE);
    world.setTemperatureC(3, 3, 900.0);
    world.step();

    EXPECT_GE(world.temperatureAt(3, 3), world.ambientTemperature() - 1e-6);
    EXPECT_LT(world.temperatureAt(3, 3), 900.0);
}

TEST(WorldGasFlow, PressurisedSteamSpreadsIntoAir) {
    World world(9, 9, 1);
    world.fillBorder(MaterialType::BEDROCK);
    world.paintCircleWithTemperature(4, 4, 0, MaterialType::STEAM, 200.0);
    ASSERT_EQ(world.materialAt(4, 4), MaterialType::STEAM);

    WorldInspector::setMass(world, 4, 4, world.massAt(4, 4) * 100.0);
    WorldInspector::setEnergy(world, 4, 4, world.energyAt(4, 4) * 100.0);
    WorldInspector::refreshGasPressure(world, 4, 4);
    ASSERT_GT(world.pressureAt(4, 4), 50.0 * world.ambientPressure());

    world.step();

    EXPECT_GT(world.lastTickStats().gasTransfers, 0);
    EXPECT_GT(world.countMaterial(MaterialType::STEAM), 1);
}

TEST(WorldGasFlow, TransferConservesEnergyAndMass) {
    World world(8, 8, 1);
    world.paintCircleWithTemperature(3, 3, 0, MaterialType::STEAM, 250.0);
    world.paintCircleWithTemperature(4, 3, 0, MaterialType::STEAM, 250.0);
    WorldInspector::setMass(world, 3, 3, world.massAt(3, 3) * 4.0);
    WorldInspector::setEnergy(world, 3, 3, world.energyAt(3, 3) * 4.0);
    WorldInspector::refreshGasPressure(world, 3, 3);

    int a = WorldInspector::index(world, 3, 3);
    int b = WorldInspector::index(world, 4, 3);
    double e0 = world.energyAt(3, 3) + world.energyAt(4, 3);
    double m0 = world.massAt(3, 3) + world.massAt(4, 3);
    double pHigh = world.pressureAt(3, 3);

    WorldInspector::flowGas(world, a, b);

    EXPECT_NEAR(world.energyAt(3, 3) + world.energyAt(4, 3), e0, e0 * 1e-12);
    EXPECT_NEAR(world.massAt(3, 3) + world.massAt(4, 3), m0, m0 * 1e-12);
    EXPECT_LT(world.pressureAt(3, 3), pHigh);
    EXPECT_GT(world.pressureAt(4, 3), world.ambientPressure());
}

TEST(WorldGasFlow, SmallPressureDifferencesDoNotFlow) {
    World world(8, 8, 1);
    world.fillBorder(MaterialType::BEDROCK);
    world.paintCircleWithTemperature(3, 6, 0, MaterialType::STEAM, 200.0);
    world.paintCircleWithTemperature(4, 6, 0, MaterialType::STEAM, 200.0);

    ThermoTuning tuning;
    ASSERT_LT(std::abs(world.pressureAt(3, 6) - world.pressureAt(4, 6)), tuning.gasFlowThresholdPa);
    world.step();
    EXPECT_EQ(world.lastTickStats().gasTransfers, 0);
}

TEST(WorldGasFlow, ExhaustedSourceRevertsToAir) {
    World world(6, 6, 1);
    world.setCell(2, 2, MaterialType::STEAM);
    world.setCell(3, 2, MaterialType::STEAM);

    // Hot, almost empty source next to a cold, even emptier target
    WorldInspector::setMass(world, 2, 2, 1.2 * GAS_REVERT_MASS_KG);
    WorldInspector::setEnergy(world, 2, 2, 1.0);
    WorldInspector::refreshGasPressure(world, 2, 2);
    WorldInspector::setMass(world, 3, 2, MIN_GAS_MASS_KG);
    WorldInspector::setEnergy(world, 3, 2, 0.0);
    WorldInspector::refreshGasPressure(world, 3, 2);
    ASSERT_GT(world.pressureAt(2, 2), world.pressureAt(3, 2));

    WorldInspector::flowGas(world, WorldInspector::index(world, 2, 2), WorldInspector::index(world, 3, 2));

    EXPECT_EQ(world.materialAt(2, 2), MaterialType::AIR);
    EXPECT_DOUBLE_EQ(world.pressureAt(2, 2), world.ambientPressure());
    EXPECT_EQ(world.materialAt(3, 2), MaterialType::STEAM);
}
