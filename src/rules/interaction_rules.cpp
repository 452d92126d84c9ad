#include "coinpusher/rules/interaction_rules.hpp"

#include <cassert>

namespace Rules {

namespace {

const std::array<CombineRule, 3> kCombineRules = {{
    {CoinType::Seed,  CoinType::Water, CoinType::Tree},
    {CoinType::Magma, CoinType::Ice,   CoinType::Obsidian},
    {CoinType::Key,   CoinType::Chest, CoinType::Diamond},
}};

const TransmuteRule kTransmuteRule = {CoinType::Gold, CoinType::Standard, CoinType::Gold};

using ProductRow = std::array<std::optional<CoinType>, CoinTypeCount>;
using ProductMatrix = std::array<ProductRow, CoinTypeCount>;

// Expands the rule list into a symmetric lookup matrix
ProductMatrix buildProductMatrix() {
    ProductMatrix matrix{};
    for (const auto &rule : kCombineRules) {
        matrix[CoinCatalog::indexOf(rule.a)][CoinCatalog::indexOf(rule.b)] = rule.product;
        matrix[CoinCatalog::indexOf(rule.b)][CoinCatalog::indexOf(rule.a)] = rule.product;
    }
    return matrix;
}

std::array<std::uint8_t, CoinTypeCount> buildClassTable() {
    std::array<std::uint8_t, CoinTypeCount> classes{};
    for (const auto &rule : kCombineRules) {
        classes[CoinCatalog::indexOf(rule.a)] |= CLASS_REACTIVE;
        classes[CoinCatalog::indexOf(rule.b)] |= CLASS_REACTIVE;
    }
    classes[CoinCatalog::indexOf(CoinType::Splitter)] |= CLASS_SPLITTER;
    classes[CoinCatalog::indexOf(kTransmuteRule.catalyst)] |= CLASS_TRANSMUTER;
    classes[CoinCatalog::indexOf(CoinType::Bomb)] |= CLASS_EXPLOSIVE;
    return classes;
}

const ProductMatrix &productMatrix() {
    static const ProductMatrix matrix = buildProductMatrix();
    return matrix;
}

const std::array<std::uint8_t, CoinTypeCount> &classTable() {
    static const std::array<std::uint8_t, CoinTypeCount> classes = buildClassTable();
    return classes;
}

} // namespace

const std::array<CombineRule, 3> &combineRules() {
    return kCombineRules;
}

const TransmuteRule &transmuteRule() {
    return kTransmuteRule;
}

std::optional<CoinType> combine(CoinType a, CoinType b) {
    return productMatrix()[CoinCatalog::indexOf(a)][CoinCatalog::indexOf(b)];
}

std::uint8_t classOf(CoinType type) {
    return classTable()[CoinCatalog::indexOf(type)];
}

bool isReactive(CoinType type)   { return (classOf(type) & CLASS_REACTIVE) != 0; }
bool isSplitter(CoinType type)   { return (classOf(type) & CLASS_SPLITTER) != 0; }
bool isTransmuter(CoinType type) { return (classOf(type) & CLASS_TRANSMUTER) != 0; }
bool isExplosive(CoinType type)  { return (classOf(type) & CLASS_EXPLOSIVE) != 0; }

bool participates(CoinType type) {
    return classOf(type) != CLASS_NONE;
}

void validateRuleTable() {
    for (CoinType a : CoinCatalog::allTypes()) {
        for (CoinType b : CoinCatalog::allTypes()) {
            assert(combine(a, b) == combine(b, a) && "Combine table must be symmetric.");
            if (combine(a, b)) {
                assert(isReactive(a) && isReactive(b) && "Reactants must be flagged reactive.");
            }
        }
    }
    for (const auto &rule : kCombineRules) {
        assert(rule.a != rule.b && "A coin type cannot fuse with itself.");
        assert(!isReactive(rule.product) && "Products must not feed further reactions.");
    }
    // Reducer classifies each contact into at most one reaction
    for (CoinType type : CoinCatalog::allTypes()) {
        std::uint8_t const cls = classOf(type);
        assert((cls & (cls - 1)) == 0 && "A coin type belongs to at most one collision class.");
        (void)cls;
    }
    assert(kTransmuteRule.base != kTransmuteRule.terminal && "Transmute must change the type.");
}

} // namespace Rules
