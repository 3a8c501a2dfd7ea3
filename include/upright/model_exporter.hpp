#pragma once

#include "upright/controller_net.hpp"
#include <json/json.h>
#include <chrono>
#include <string>
#include <vector>

namespace upright {

struct ExportMetadata {
    std::string robotType;     // morphology key
    std::string robotName;     // display name
    int sensorCount = 0;
    int motorCount = 0;
    size_t trainingSamples = 0;
    std::string modelName;
    std::string createdAt;     // ISO-8601 UTC, filled at export when empty
};

// User-visible outcome of an export; failures never throw
struct ExportResult {
    bool success = false;
    std::string filename;
    std::string path;
    std::string error;
};

// One tensor of a weight document, flat row-major float32
struct NamedTensor {
    std::string name;           // layer_<index>_<parameter>
    std::string parameter;      // parameter name inside the network
    std::vector<int64_t> shape;
    std::vector<float> data;

    torch::Tensor toTensor() const;
};

struct WeightDocument {
    ExportMetadata metadata;
    std::string version;
    std::vector<NamedTensor> tensors;
};

/**
 * JSON weight document writer/reader.
 *
 * Layout:
 *   { "metadata": {format, framework, created_at, model_type, architecture,
 *                  robot_type, robot_name, sensor_count, motor_count,
 *                  training_samples, model_name, export_version},
 *     "tensors":  { "layer_<i>_<name>": {dtype: "F32", shape: [...], data: [...]} },
 *     "version":  "1.0" }
 *
 * Floats are written with round-trip precision, so parsing a document
 * reproduces the exported float32 values exactly.
 */
class ModelExporter {
public:
    static constexpr const char* kFormat = "libtorch";
    static constexpr const char* kVersion = "1.0";

    static Json::Value toJson(const ControllerNetImpl& net, const ExportMetadata& metadata);
    static std::string serialize(const Json::Value& document);

    // "<robot id>_upright_model_<YYYY-MM-DD>.safetensors.json"
    static std::string defaultFilename(const std::string& robotType,
                                       std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

    static std::string isoTimestamp(std::chrono::system_clock::time_point when);

    // Writes into `directory` (created if missing). Never throws.
    static ExportResult exportToFile(const ControllerNetImpl& net, ExportMetadata metadata,
                                     const std::string& directory);

    // Throws UprightError(ImportError) on malformed documents
    static WeightDocument parse(const std::string& text);
    static WeightDocument load(const std::string& path);

    // Parameter name -> tensor, ready for ControllerNetImpl::load_state_dict
    static std::unordered_map<std::string, torch::Tensor> toStateDict(const WeightDocument& document);
};

} // namespace upright
