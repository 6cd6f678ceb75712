#include "Material.h"
#include "ThermoConstants.h"

namespace {

// ============== ELEMENT DEFINITIONS ==============
// Indexed by id; the order must match MaterialType.

constexpr MaterialDefinition DEFINITIONS[Materials::COUNT] = {
    // Air is a real thermodynamic medium so hot objects can heat nearby air
    {
        .id = MaterialType::AIR,
        .name = "Air",
        .argb = 0xFF000000,
        .family = MaterialFamily::AIR,
        .phase = Phase::GAS,
        .immobile = false,
        .phaseLocked = true,
        .densityKgM3 = 1.225,
        .specificHeatJKgK = 1005.0,
        .conductivityWMK = 0.024,
        .emissivity = 0.0,
        .gasConstantJKgK = 287.05,
    },
    {
        .id = MaterialType::STONE,
        .name = "Stone",
        .argb = 0xFF6B6B6B,
        .family = MaterialFamily::ROCK,
        .phase = Phase::SOLID,
        .immobile = true,
        .phaseLocked = false,
        .densityKgM3 = 2700.0,
        .specificHeatJKgK = 790.0,
        .conductivityWMK = 2.8,
        .emissivity = 0.9,
        .gasConstantJKgK = 0.0,
    },
    {
        .id = MaterialType::SAND,
        .name = "Sand",
        .argb = 0xFFE1C16E,
        .family = MaterialFamily::SAND,
        .phase = Phase::SOLID,
        .immobile = false,
        .phaseLocked = false,
        .densityKgM3 = 1600.0,
        .specificHeatJKgK = 830.0,
        .conductivityWMK = 0.27,
        .emissivity = 0.9,
        .gasConstantJKgK = 0.0,
    },
    {
        .id = MaterialType::WATER,
        .name = "Water",
        .argb = 0xFF3D8BFF,
        .family = MaterialFamily::WATER,
        .phase = Phase::LIQUID,
        .immobile = false,
        .phaseLocked = false,
        .densityKgM3 = 1000.0,
        .specificHeatJKgK = 4182.0,
        .conductivityWMK = 0.6,
        .emissivity = 0.96,
        .gasConstantJKgK = 0.0,
    },
    // Border / containment
    {
        .id = MaterialType::BEDROCK,
        .name = "Bedrock",
        .argb = 0xFF4A4A4A,
        .family = MaterialFamily::ROCK,
        .phase = Phase::SOLID,
        .immobile = true,
        .phaseLocked = true,
        .densityKgM3 = 2700.0,
        .specificHeatJKgK = 790.0,
        .conductivityWMK = 2.8,
        .emissivity = 0.9,
        .gasConstantJKgK = 0.0,
    },
    {
        .id = MaterialType::ICE,
        .name = "Ice",
        .argb = 0xFFD8F0FF,
        .family = MaterialFamily::WATER,
        .phase = Phase::SOLID,
        .immobile = false,
        .phaseLocked = false,
        .densityKgM3 = 917.0,
        .specificHeatJKgK = 2050.0,
        .conductivityWMK = 2.22,
        .emissivity = 0.97,
        .gasConstantJKgK = 0.0,
    },
    {
        .id = MaterialType::STEAM,
        .name = "Steam",
        .argb = 0xFFCCCCCC,
        .family = MaterialFamily::WATER,
        .phase = Phase::GAS,
        .immobile = false,
        .phaseLocked = false,
        .densityKgM3 = 0.6,
        .specificHeatJKgK = 2010.0,
        .conductivityWMK = 0.025,
        .emissivity = 0.0,
        .gasConstantJKgK = ThermoConstants::WATER_VAPOR_GAS_CONSTANT,
    },
    {
        .id = MaterialType::MOLTEN_SILICA,
        .name = "Molten Silica",
        .argb = 0xFFFF9A2E,
        .family = MaterialFamily::SAND,
        .phase = Phase::LIQUID,
        .immobile = false,
        .phaseLocked = false,
        .densityKgM3 = 2200.0,
        .specificHeatJKgK = 1000.0,
        .conductivityWMK = 1.5,
        .emissivity = 0.85,
        .gasConstantJKgK = 0.0,
    },
    {
        .id = MaterialType::SILICA_VAPOR,
        .name = "Silica Vapor",
        .argb = 0xFFBFA6FF,
        .family = MaterialFamily::SAND,
        .phase = Phase::GAS,
        .immobile = false,
        .phaseLocked = false,
        .densityKgM3 = 1.0,
        .specificHeatJKgK = 1200.0,
        .conductivityWMK = 0.03,
        .emissivity = 0.0,
        .gasConstantJKgK = 138.4,  // SiO2, M = 60.08 g/mol
    },
    {
        .id = MaterialType::MOLTEN_ROCK,
        .name = "Molten Rock",
        .argb = 0xFFFF3B1F,
        .family = MaterialFamily::ROCK,
        .phase = Phase::LIQUID,
        .immobile = false,
        .phaseLocked = false,
        .densityKgM3 = 2600.0,
        .specificHeatJKgK = 1200.0,
        .conductivityWMK = 1.5,
        .emissivity = 0.9,
        .gasConstantJKgK = 0.0,
    },
    {
        .id = MaterialType::ROCK_VAPOR,
        .name = "Rock Vapor",
        .argb = 0xFFFF66CC,
        .family = MaterialFamily::ROCK,
        .phase = Phase::GAS,
        .immobile = false,
        .phaseLocked = false,
        .densityKgM3 = 1.2,
        .specificHeatJKgK = 1300.0,
        .conductivityWMK = 0.04,
        .emissivity = 0.0,
        .gasConstantJKgK = 130.0,
    },
};

// ============== FAMILY PHASE TRIADS ==============

constexpr int FAMILY_COUNT = 4;

constexpr FamilyDefinition FAMILIES[FAMILY_COUNT] = {
    {
        .family = MaterialFamily::AIR,
        .solid = MaterialType::AIR,
        .liquid = MaterialType::AIR,
        .gas = MaterialType::AIR,
        .meltPointC = 0.0,
        .boilPointC = 0.0,
        .latentFusionJKg = 0.0,
        .latentVaporJKg = 0.0,
        .pressureDependentBoiling = false,
        .hasPhaseChanges = false,
    },
    {
        .family = MaterialFamily::WATER,
        .solid = MaterialType::ICE,
        .liquid = MaterialType::WATER,
        .gas = MaterialType::STEAM,
        .meltPointC = 0.0,
        .boilPointC = 100.0,
        .latentFusionJKg = 333550.0,
        .latentVaporJKg = 2256000.0,
        .pressureDependentBoiling = true,
        .hasPhaseChanges = true,
    },
    // Silica (game approximation)
    {
        .family = MaterialFamily::SAND,
        .solid = MaterialType::SAND,
        .liquid = MaterialType::MOLTEN_SILICA,
        .gas = MaterialType::SILICA_VAPOR,
        .meltPointC = 1550.0,
        .boilPointC = 2230.0,
        .latentFusionJKg = 156000.0,
        .latentVaporJKg = 10000000.0,
        .pressureDependentBoiling = false,
        .hasPhaseChanges = true,
    },
    // Granite-like rock (game approximation)
    {
        .family = MaterialFamily::ROCK,
        .solid = MaterialType::STONE,
        .liquid = MaterialType::MOLTEN_ROCK,
        .gas = MaterialType::ROCK_VAPOR,
        .meltPointC = 1250.0,
        .boilPointC = 3000.0,
        .latentFusionJKg = 400000.0,
        .latentVaporJKg = 5000000.0,
        .pressureDependentBoiling = false,
        .hasPhaseChanges = true,
    },
};

constexpr bool tableIsDense() {
    for (int i = 0; i < Materials::COUNT; ++i) {
        if (static_cast<int>(DEFINITIONS[i].id) != i) return false;
    }
    for (int i = 0; i < FAMILY_COUNT; ++i) {
        if (static_cast<int>(FAMILIES[i].family) != i) return false;
    }
    return true;
}

static_assert(tableIsDense(), "material and family tables must be indexed by id");

} // namespace

namespace Materials {

bool isDefined(MaterialType type) {
    int id = static_cast<int>(type);
    return id >= 0 && id <= MAX_ID;
}

const MaterialDefinition& lookup(MaterialType type) {
    return lookup(static_cast<int>(type));
}

const MaterialDefinition& lookup(int id) {
    if (id < 0 || id > MAX_ID) return DEFINITIONS[0];
    return DEFINITIONS[id];
}

std::vector<MaterialType> paletteForUI() {
    return {MaterialType::STONE, MaterialType::SAND, MaterialType::WATER};
}

const FamilyDefinition& family(MaterialFamily family) {
    int idx = static_cast<int>(family);
    if (idx < 0 || idx >= FAMILY_COUNT) return FAMILIES[0];
    return FAMILIES[idx];
}

const MaterialDefinition& solidOf(MaterialFamily f) {
    return lookup(family(f).solid);
}

const MaterialDefinition& liquidOf(MaterialFamily f) {
    return lookup(family(f).liquid);
}

const MaterialDefinition& gasOf(MaterialFamily f) {
    return lookup(family(f).gas);
}

bool isGas(MaterialType type) {
    return lookup(type).phase == Phase::GAS;
}

bool isLiquid(MaterialType type) {
    return lookup(type).phase == Phase::LIQUID;
}

bool isFloatingSolid(MaterialType type) {
    const MaterialDefinition& def = lookup(type);
    if (def.phase != Phase::SOLID || def.immobile) return false;
    const MaterialDefinition& liquid = liquidOf(def.family);
    return liquid.phase == Phase::LIQUID && def.densityKgM3 < liquid.densityKgM3;
}

bool isGranular(MaterialType type) {
    const MaterialDefinition& def = lookup(type);
    return def.phase == Phase::SOLID && !def.immobile && !isFloatingSolid(type);
}

double condensedCellMassKg(MaterialType type) {
    return lookup(type).densityKgM3 * ThermoConstants::CELL_VOLUME_M3;
}

} // namespace Materials
