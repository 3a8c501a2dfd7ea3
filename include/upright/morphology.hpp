#pragma once

#include <optional>
#include <string>
#include <vector>

namespace upright {

enum class MorphologyId {
    Biped,
    Quadruped,
    Spider
};

// Hidden-layer sizing of the controller network
enum class CapacityTier {
    Small,   // 64-32-16
    Medium,  // 128-64-32
    Large    // 256-128-64
};

struct Morphology {
    MorphologyId id;
    std::string key;          // "biped" | "quadruped" | "spider"
    std::string displayName;
    std::string description;
    int sensorCount;
    int motorCount;
    CapacityTier capacityTier;
};

// Registry lookups. The table is immutable and lives for the whole process.
const std::vector<Morphology>& allMorphologies();
const Morphology& morphology(MorphologyId id);
std::optional<Morphology> findMorphology(const std::string& key);

// Throws UprightError(ConfigError) for unknown keys
const Morphology& morphology(const std::string& key);

const char* to_string(MorphologyId id);
const char* to_string(CapacityTier tier);

// Hidden layer widths for a capacity tier, input side first
std::vector<int> hiddenLayers(CapacityTier tier);

} // namespace upright
