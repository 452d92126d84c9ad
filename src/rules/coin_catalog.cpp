#include "coinpusher/rules/coin_catalog.hpp"

#include <cassert>

namespace CoinCatalog {

namespace {

// Rows must stay in CoinType declaration order
const std::array<CoinSpec, CoinTypeCount> kSpecs = {{
    {CoinType::Standard, "Standard Chip",    10,   100,  5,    "Basic reliable currency.",        1.0, 0.4,  0.05, 1.0},
    {CoinType::Splitter, "Splitter Cell",    15,   150,  50,   "High bounciness. Unstable.",      1.0, 0.4,  0.8,  1.0},
    {CoinType::Heavy,    "Heavy Anchor",     20,   300,  80,   "Massive weight. Pushes piles.",   5.0, 0.4,  0.05, 1.0},
    {CoinType::Gold,     "Midas Touch",      100,  1000, 200,  "High value target.",              1.0, 0.4,  0.05, 1.0},
    {CoinType::Bomb,     "Cluster Bomb",     5,    50,   150,  "Explodes on impact.",             1.0, 0.4,  0.05, 1.0},
    {CoinType::Seed,     "Nanoseed",         5,    50,   40,   "Combine with Hydro-Vial.",        1.0, 0.4,  0.05, 1.0},
    {CoinType::Water,    "Hydro-Vial",       5,    50,   40,   "Combine with Nanoseed.",          1.0, 0.4,  0.05, 1.0},
    {CoinType::Magma,    "Pyro-Core",        10,   80,   60,   "Hot! Combine with Cryo-Cell.",    1.0, 0.4,  0.05, 1.0},
    {CoinType::Ice,      "Cryo-Cell",        10,   80,   60,   "Cold! Combine with Pyro-Core.",   1.0, 0.05, 0.05, 1.0},
    {CoinType::Key,      "Access Key",       50,   200,  120,  "Unlocks Cached Chests.",          1.0, 0.4,  0.05, 1.0},
    {CoinType::Chest,    "Locked Cache",     50,   200,  120,  "Needs an Access Key.",            1.0, 0.4,  0.05, 1.0},
    {CoinType::Tree,     "Yggdrasil Node",   500,  5000, 9999, "Grown from Seed + Water.",        4.0, 0.4,  0.05, 1.2},
    {CoinType::Obsidian, "Obsidian Slab",    300,  3000, 9999, "Forged from Fire + Ice. Heavy.",  8.0, 1.0,  0.05, 1.2},
    {CoinType::Diamond,  "Quantum Diamond",  1000, 10000, 9999, "Unlocked from Cache.",           1.0, 0.4,  0.05, 1.0},
}};

const std::array<CoinType, CoinTypeCount> kAllTypes = {
    CoinType::Standard, CoinType::Splitter, CoinType::Heavy, CoinType::Gold,
    CoinType::Bomb, CoinType::Seed, CoinType::Water, CoinType::Magma,
    CoinType::Ice, CoinType::Key, CoinType::Chest, CoinType::Tree,
    CoinType::Obsidian, CoinType::Diamond,
};

} // namespace

const CoinSpec &spec(CoinType type) {
    return kSpecs[indexOf(type)];
}

const std::array<CoinType, CoinTypeCount> &allTypes() {
    return kAllTypes;
}

std::string typeName(CoinType type) {
    switch (type) {
        case CoinType::Standard: return "STANDARD";
        case CoinType::Splitter: return "SPLITTER";
        case CoinType::Heavy:    return "HEAVY";
        case CoinType::Gold:     return "GOLD";
        case CoinType::Bomb:     return "BOMB";
        case CoinType::Seed:     return "SEED";
        case CoinType::Water:    return "WATER";
        case CoinType::Magma:    return "MAGMA";
        case CoinType::Ice:      return "ICE";
        case CoinType::Key:      return "KEY";
        case CoinType::Chest:    return "CHEST";
        case CoinType::Tree:     return "TREE";
        case CoinType::Obsidian: return "OBSIDIAN";
        case CoinType::Diamond:  return "DIAMOND";
        default: return "UNKNOWN";
    }
}

std::optional<CoinType> parseTypeName(const std::string &name) {
    for (CoinType type : kAllTypes) {
        if (typeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

void validateCatalog() {
    for (std::size_t i = 0; i < CoinTypeCount; ++i) {
        assert(indexOf(kSpecs[i].type) == i && "Catalog row out of order.");
        assert(indexOf(kAllTypes[i]) == i && "Type list out of order.");
        assert(kSpecs[i].value >= 0 && kSpecs[i].score >= 0 && kSpecs[i].cost > 0 && "Bad coin economics.");
        assert(kSpecs[i].mass > 0.0 && "Coin mass must be positive.");
        assert(typeName(kAllTypes[i]) != "UNKNOWN" && "Coin type without a name.");
    }
}

} // namespace CoinCatalog
