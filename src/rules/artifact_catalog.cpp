#include "coinpusher/rules/artifact_catalog.hpp"

namespace ArtifactCatalog {

const char *const Magnet = "magnet";
const char *const Extender = "extender";
const char *const Mult = "mult";

const std::vector<ArtifactSpec> &all() {
    static const std::vector<ArtifactSpec> artifacts = {
        {Magnet,   "Flux Magnet",      "Coins settle faster per level.", 300},
        {Extender, "Bed Extender",     "Widens playing area.",           500},
        {Mult,     "Score Multiplier", "Score x1.5 per level.",          800},
    };
    return artifacts;
}

std::optional<ArtifactSpec> find(const std::string &id) {
    for (const auto &spec : all()) {
        if (spec.id == id) {
            return spec;
        }
    }
    return std::nullopt;
}

} // namespace ArtifactCatalog
