#include "upright/morphology.hpp"
#include "upright/error.hpp"

namespace upright {

const std::vector<Morphology>& allMorphologies() {
    static const std::vector<Morphology> table = {
        {MorphologyId::Biped,     "biped",     "Biped Boss",  "Two-legged humanoid robot", 28, 8,  CapacityTier::Small},
        {MorphologyId::Quadruped, "quadruped", "Quad Boss",   "Four-legged robot",         32, 12, CapacityTier::Medium},
        {MorphologyId::Spider,    "spider",    "Spider Boss", "Six-legged robot",          40, 18, CapacityTier::Large},
    };
    return table;
}

const Morphology& morphology(MorphologyId id) {
    for (const auto& m : allMorphologies()) {
        if (m.id == id) return m;
    }
    throw UprightError(ErrorCode::InvalidArgument, "Unregistered morphology id");
}

std::optional<Morphology> findMorphology(const std::string& key) {
    for (const auto& m : allMorphologies()) {
        if (m.key == key) return m;
    }
    return std::nullopt;
}

const Morphology& morphology(const std::string& key) {
    for (const auto& m : allMorphologies()) {
        if (m.key == key) return m;
    }
    throw UprightError(ErrorCode::ConfigError, key,
        "Unknown morphology (expected biped, quadruped or spider)");
}

const char* to_string(MorphologyId id) {
    switch (id) {
        case MorphologyId::Biped:     return "biped";
        case MorphologyId::Quadruped: return "quadruped";
        case MorphologyId::Spider:    return "spider";
        default:                      return "unknown";
    }
}

const char* to_string(CapacityTier tier) {
    switch (tier) {
        case CapacityTier::Small:  return "small";
        case CapacityTier::Medium: return "medium";
        case CapacityTier::Large:  return "large";
        default:                   return "unknown";
    }
}

std::vector<int> hiddenLayers(CapacityTier tier) {
    switch (tier) {
        case CapacityTier::Small:  return {64, 32, 16};
        case CapacityTier::Medium: return {128, 64, 32};
        case CapacityTier::Large:  return {256, 128, 64};
    }
    return {64, 32, 16};
}

} // namespace upright
