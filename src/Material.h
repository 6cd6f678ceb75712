#pragma once
#include <cstdint>
#include <vector>

enum class MaterialFamily : unsigned char {
    AIR = 0,
    WATER = 1,
    SAND = 2,
    ROCK = 3
};

// Thermodynamic phase. Powders such as sand are still SOLID.
enum class Phase : unsigned char {
    SOLID,
    LIQUID,
    GAS
};

// Cell material ids. Dense over [0, MAX_ID]; the grid stores only the id.
enum class MaterialType : unsigned char {
    AIR = 0,
    STONE = 1,
    SAND = 2,
    WATER = 3,
    BEDROCK = 4,
    ICE = 5,
    STEAM = 6,
    MOLTEN_SILICA = 7,
    SILICA_VAPOR = 8,
    MOLTEN_ROCK = 9,
    ROCK_VAPOR = 10
};

struct MaterialDefinition {
    // Identity
    MaterialType id;
    const char* name;
    uint32_t argb;          // Render color, 0xAARRGGBB
    MaterialFamily family;
    Phase phase;

    // Behavior flags
    bool immobile;          // Never participates in movement (may still change phase)
    bool phaseLocked;       // Never changes phase regardless of energy

    // Physical constants
    double densityKgM3;
    double specificHeatJKgK;
    double conductivityWMK;
    double emissivity;      // 0..1
    double gasConstantJKgK; // Zero for condensed matter
};

// Per-family phase triad plus phase-change constants (at the reference pressure).
struct FamilyDefinition {
    MaterialFamily family;
    MaterialType solid;
    MaterialType liquid;
    MaterialType gas;
    double meltPointC;
    double boilPointC;
    double latentFusionJKg;
    double latentVaporJKg;
    bool pressureDependentBoiling;
    bool hasPhaseChanges;
};

namespace Materials {

constexpr int MAX_ID = static_cast<int>(MaterialType::ROCK_VAPOR);
constexpr int COUNT = MAX_ID + 1;

// True if the id resolves to a registered definition.
bool isDefined(MaterialType type);

// O(1) lookup. Undefined ids fall back to the air definition.
const MaterialDefinition& lookup(MaterialType type);
const MaterialDefinition& lookup(int id);

// Materials a user may paint directly. Phase-derived forms are not included.
std::vector<MaterialType> paletteForUI();

const FamilyDefinition& family(MaterialFamily family);
const MaterialDefinition& solidOf(MaterialFamily family);
const MaterialDefinition& liquidOf(MaterialFamily family);
const MaterialDefinition& gasOf(MaterialFamily family);

// Convenience predicates used by the movement rules.
bool isGas(MaterialType type);
bool isLiquid(MaterialType type);
bool isFloatingSolid(MaterialType type);
bool isGranular(MaterialType type);

// Mass of one fully packed cell at the material's density.
double condensedCellMassKg(MaterialType type);

} // namespace Materials
