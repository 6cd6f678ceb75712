#include <gtest/gtest.h>
#include "World.h"
#include "WorldInspector.h"
#include "Thermo.h"
#include <cmath>
#include <random>

namespace {

// Bordered box with room for one column of falling cells.
class BorderedWorldTest : public ::testing::Test {
protected:
    BorderedWorldTest() : world(10, 10, 42) {
        world.fillBorder(MaterialType::BEDROCK);
    }

    World world;
};

double totalEnergy(const World& world, int a, int b) {
    int w = world.width();
    return world.energyAt(a % w, a / w) + world.energyAt(b % w, b / w);
}

double totalMass(const World& world, int a, int b) {
    int w = world.width();
    return world.massAt(a % w, a / w) + world.massAt(b % w, b / w);
}

} // namespace

TEST_F(BorderedWorldTest, SandFallsOneRow) {
    world.setCell(4, 3, MaterialType::SAND);
    world.step();

    EXPECT_EQ(world.materialAt(4, 4), MaterialType::SAND);
    EXPECT_EQ(world.materialAt(4, 3), MaterialType::AIR);
    EXPECT_EQ(world.countMaterial(MaterialType::SAND), 1);
}

TEST_F(BorderedWorldTest, WaterFallsOneRow) {
    world.setCell(4, 3, MaterialType::WATER);
    world.step();

    EXPECT_EQ(world.materialAt(4, 4), MaterialType::WATER);
    EXPECT_EQ(world.materialAt(4, 3), MaterialType::AIR);
}

TEST_F(BorderedWorldTest, SandSinksBelowWater) {
    world.setCell(4, 8, MaterialType::WATER);
    world.setCell(4, 7, MaterialType::SAND);
    world.step();

    EXPECT_EQ(world.materialAt(4, 8), MaterialType::SAND);
    EXPECT_EQ(world.materialAt(4, 7), MaterialType::WATER);
}

TEST_F(BorderedWorldTest, LiquidUnderSandIsHeldInPlace) {
    world.setCell(5, 4, MaterialType::SAND);
    world.setCell(5, 5, MaterialType::WATER);
    world.step();

    // The water does not drop into the air below; the sand swaps into it instead
    EXPECT_EQ(world.materialAt(5, 6), MaterialType::AIR);
    EXPECT_EQ(world.materialAt(5, 5), MaterialType::SAND);
    EXPECT_EQ(world.materialAt(5, 4), MaterialType::WATER);
}

TEST_F(BorderedWorldTest, SandRestsOnFloorAndPilesDiagonally) {
    world.setCell(4, 8, MaterialType::SAND);
    world.setCell(4, 7, MaterialType::SAND);
    world.step();

    EXPECT_EQ(world.materialAt(4, 8), MaterialType::SAND);
    EXPECT_EQ(world.materialAt(4, 7), MaterialType::AIR);
    bool slidLeft = world.materialAt(3, 8) == MaterialType::SAND;
    bool slidRight = world.materialAt(5, 8) == MaterialType::SAND;
    EXPECT_NE(slidLeft, slidRight);
}

TEST_F(BorderedWorldTest, WaterSpreadsSidewaysOnFloor) {
    world.setCell(4, 8, MaterialType::WATER);
    world.setCell(4, 7, MaterialType::WATER);
    world.step();

    // The floor cell slides aside and the upper cell drops into its place
    EXPECT_EQ(world.countMaterial(MaterialType::WATER), 2);
    EXPECT_EQ(world.materialAt(4, 8), MaterialType::WATER);
    EXPECT_EQ(world.materialAt(4, 7), MaterialType::AIR);
}

TEST_F(BorderedWorldTest, IceFloatsUpThroughWater) {
    world.paintCircleWithTemperature(4, 8, 0, MaterialType::ICE, -10.0);
    world.setCell(4, 7, MaterialType::WATER);
    ASSERT_EQ(world.materialAt(4, 8), MaterialType::ICE);

    world.step();

    EXPECT_EQ(world.materialAt(4, 7), MaterialType::ICE);
    EXPECT_EQ(world.materialAt(4, 8), MaterialType::WATER);
}

TEST_F(BorderedWorldTest, IceFallsThroughAir) {
    world.paintCircleWithTemperature(4, 3, 0, MaterialType::ICE, -10.0);
    world.step();

    EXPECT_EQ(world.materialAt(4, 4), MaterialType::ICE);
    EXPECT_EQ(world.materialAt(4, 3), MaterialType::AIR);
}

TEST_F(BorderedWorldTest, SteamRisesIntoAir) {
    world.paintCircleWithTemperature(4, 6, 0, MaterialType::WATER, 150.0);
    ASSERT_EQ(world.materialAt(4, 6), MaterialType::STEAM);

    world.step();

    EXPECT_EQ(world.materialAt(4, 5), MaterialType::STEAM);
    EXPECT_EQ(world.materialAt(4, 6), MaterialType::AIR);
}

TEST_F(BorderedWorldTest, StoneAndBedrockNeverMove) {
    world.setCell(4, 3, MaterialType::STONE);
    for (int i = 0; i < 10; ++i) world.step();

    EXPECT_EQ(world.materialAt(4, 3), MaterialType::STONE);
    EXPECT_EQ(world.countMaterial(MaterialType::BEDROCK), 36);
}

TEST_F(BorderedWorldTest, AirAloneDoesNotSwap) {
    world.step();
    EXPECT_EQ(world.lastTickStats().swaps, 0);
    EXPECT_EQ(world.lastTickStats().gasTransfers, 0);
    EXPECT_EQ(world.lastTickStats().phaseChanges, 0);
}

TEST_F(BorderedWorldTest, TickIdAdvances) {
    uint64_t start = world.tickId();
    world.step();
    world.step();
    EXPECT_EQ(world.tickId(), start + 2);
}

TEST_F(BorderedWorldTest, TickIdKeepsCountingPastThirtyTwoBits) {
    WorldInspector::setTick(world, 0xFFFFFFFFull);
    world.setCell(4, 3, MaterialType::SAND);

    world.step();
    EXPECT_EQ(world.tickId(), 0x100000000ull);
    EXPECT_EQ(world.materialAt(4, 4), MaterialType::SAND);

    world.step();
    EXPECT_EQ(world.tickId(), 0x100000001ull);
    EXPECT_EQ(world.materialAt(4, 5), MaterialType::SAND);
}

TEST_F(BorderedWorldTest, SandPileSettlesWithoutLosingCells) {
    world.paintCircle(4, 3, 2, MaterialType::SAND);
    int sand = world.countMaterial(MaterialType::SAND);
    for (int i = 0; i < 120; ++i) world.step();

    EXPECT_EQ(world.countMaterial(MaterialType::SAND), sand);
    // Every grain is at rest: nothing open below or diagonally below
    for (int y = 1; y < 9; ++y) {
        for (int x = 1; x < 9; ++x) {
            if (world.materialAt(x, y) != MaterialType::SAND) continue;
            EXPECT_NE(world.materialAt(x, y + 1), MaterialType::AIR) << x << "," << y;
            EXPECT_NE(world.materialAt(x - 1, y + 1), MaterialType::AIR) << x << "," << y;
            EXPECT_NE(world.materialAt(x + 1, y + 1), MaterialType::AIR) << x << "," << y;
        }
    }
}

TEST(WorldSwap, SwapConservesEnergyAndMass) {
    World world(6, 6, 3);
    world.paintCircleWithTemperature(2, 2, 0, MaterialType::STONE, 600.0);
    world.paintCircleWithTemperature(3, 2, 0, MaterialType::WATER, 60.0);

    int a = WorldInspector::index(world, 2, 2);
    int b = WorldInspector::index(world, 3, 2);
    double e0 = totalEnergy(world, a, b);
    double m0 = totalMass(world, a, b);

    WorldInspector::swapCells(world, a, b);

    EXPECT_EQ(world.materialAt(2, 2), MaterialType::WATER);
    EXPECT_EQ(world.materialAt(3, 2), MaterialType::STONE);
    EXPECT_NEAR(world.temperatureAt(3, 2), 600.0, 1e-6);
    EXPECT_DOUBLE_EQ(totalEnergy(world, a, b), e0);
    EXPECT_DOUBLE_EQ(totalMass(world, a, b), m0);
}

TEST(WorldDeterminism, SameSeedSameHistory) {
    auto build = [](uint64_t seed) {
        World world(24, 20, seed);
        world.fillBorder(MaterialType::BEDROCK);
        world.paintCircle(8, 5, 3, MaterialType::SAND);
        world.paintCircle(16, 5, 3, MaterialType::WATER);
        world.paintCircleWithTemperature(12, 15, 2, MaterialType::WATER, 180.0);
        for (int i = 0; i < 25; ++i) world.step();
        return world;
    };

    World a = build(99);
    World b = build(99);
    for (int y = 0; y < a.height(); ++y) {
        for (int x = 0; x < a.width(); ++x) {
            ASSERT_EQ(a.materialAt(x, y), b.materialAt(x, y)) << x << "," << y;
            ASSERT_DOUBLE_EQ(a.energyAt(x, y), b.energyAt(x, y)) << x << "," << y;
        }
    }
}

TEST(WorldDeterminism, ReseedRestartsTieBreaks) {
    World a(16, 16, 5);
    World b(16, 16, 77);
    for (World* w : {&a, &b}) {
        w->fillBorder(MaterialType::BEDROCK);
        w->paintCircle(8, 6, 3, MaterialType::SAND);
    }
    a.reseed(1234);
    b.reseed(1234);
    for (int i = 0; i < 20; ++i) {
        a.step();
        b.step();
    }
    for (int y = 0; y < a.height(); ++y) {
        for (int x = 0; x < a.width(); ++x) {
            ASSERT_EQ(a.materialAt(x, y), b.materialAt(x, y)) << x << "," << y;
        }
    }
}

TEST(WorldFuzz, RandomScenesStayPhysical) {
    const MaterialType choices[] = {
        MaterialType::AIR, MaterialType::STONE, MaterialType::SAND, MaterialType::WATER,
        MaterialType::ICE, MaterialType::STEAM, MaterialType::MOLTEN_ROCK,
    };

    for (uint64_t seed = 1; seed <= 4; ++seed) {
        std::mt19937_64 rng(seed);
        std::uniform_int_distribution<int> pick(0, 6);
        std::uniform_real_distribution<double> temp(-200.0, 4000.0);

        World world(20, 16, seed);
        world.fillBorder(MaterialType::BEDROCK);
        for (int y = 1; y < world.height() - 1; ++y) {
            for (int x = 1; x < world.width() - 1; ++x) {
                world.paintCircleWithTemperature(x, y, 0, choices[pick(rng)], temp(rng));
            }
        }

        for (int i = 0; i < 30; ++i) {
            ASSERT_NO_THROW(world.step());
        }

        for (int y = 0; y < world.height(); ++y) {
            for (int x = 0; x < world.width(); ++x) {
                double e = world.energyAt(x, y);
                double p = world.pressureAt(x, y);
                double t = world.temperatureAt(x, y);
                EXPECT_TRUE(std::isfinite(e)) << seed << ":" << x << "," << y;
                EXPECT_GE(e, 0.0);
                EXPECT_GT(world.massAt(x, y), 0.0);
                EXPECT_GE(p, ThermoConstants::MIN_PRESSURE_PA);
                EXPECT_LE(p, ThermoConstants::MAX_PRESSURE_PA);
                EXPECT_GE(t, ThermoConstants::MIN_TEMP_C);
                EXPECT_LE(t, ThermoConstants::MAX_TEMP_C);
            }
        }
        EXPECT_EQ(world.countMaterial(MaterialType::BEDROCK), 2 * 20 + 2 * 14);
    }
}
