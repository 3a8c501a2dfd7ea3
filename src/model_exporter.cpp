#include "upright/model_exporter.hpp"
#include "upright/error.hpp"
#include "upright/log.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace upright {

namespace {

std::tm utc(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm out{};
    gmtime_r(&t, &out);
    return out;
}

// True when `shape` holds exactly `count` elements. The running product is
// bounded by `count`, so hostile shapes cannot overflow it.
bool shape_holds(const std::vector<int64_t>& shape, size_t count) {
    if (std::any_of(shape.begin(), shape.end(), [](int64_t d) { return d < 0; })) return false;
    if (std::find(shape.begin(), shape.end(), 0) != shape.end()) return count == 0;

    const int64_t limit = static_cast<int64_t>(count);
    int64_t n = 1;
    for (int64_t d : shape) {
        if (n > limit / d) return false;
        n *= d;
    }
    return n == limit;
}

// "layer_3_fc2.bias" -> (3, "fc2.bias")
bool split_tensor_name(const std::string& name, int& index, std::string& parameter) {
    const std::string prefix = "layer_";
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    size_t sep = name.find('_', prefix.size());
    if (sep == std::string::npos || sep == prefix.size()) return false;
    const std::string digits = name.substr(prefix.size(), sep - prefix.size());
    if (digits.size() > 6) return false;
    if (!std::all_of(digits.begin(), digits.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return false;
    }
    index = std::stoi(digits);
    parameter = name.substr(sep + 1);
    return !parameter.empty();
}

const Json::Value& require(const Json::Value& node, const char* key, const std::string& context) {
    if (!node.isMember(key)) {
        throw UprightError(ErrorCode::ImportError, context, std::string("Missing field '") + key + "'");
    }
    return node[key];
}

} // namespace

torch::Tensor NamedTensor::toTensor() const {
    if (!shape_holds(shape, data.size())) {
        throw UprightError(ErrorCode::DimensionMismatch, name, "Data length does not match shape");
    }
    return torch::from_blob(const_cast<float*>(data.data()), shape, torch::kFloat32).clone();
}

std::string ModelExporter::isoTimestamp(std::chrono::system_clock::time_point when) {
    std::tm t = utc(when);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;
    std::ostringstream os;
    os << std::put_time(&t, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return os.str();
}

std::string ModelExporter::defaultFilename(const std::string& robotType,
                                           std::chrono::system_clock::time_point when) {
    std::tm t = utc(when);
    std::ostringstream os;
    os << robotType << "_upright_model_" << std::put_time(&t, "%Y-%m-%d") << ".safetensors.json";
    return os.str();
}

Json::Value ModelExporter::toJson(const ControllerNetImpl& net, const ExportMetadata& metadata) {
    Json::Value meta(Json::objectValue);
    meta["format"] = kFormat;
    meta["framework"] = "libtorch";
    meta["created_at"] = metadata.createdAt.empty()
        ? isoTimestamp(std::chrono::system_clock::now()) : metadata.createdAt;
    meta["model_type"] = "sequential";
    meta["architecture"] = "robotics_controller";
    meta["robot_type"] = metadata.robotType;
    meta["robot_name"] = metadata.robotName;
    meta["sensor_count"] = metadata.sensorCount;
    meta["motor_count"] = metadata.motorCount;
    meta["training_samples"] = Json::UInt64(metadata.trainingSamples);
    meta["model_name"] = metadata.modelName;
    meta["export_version"] = kVersion;

    Json::Value tensors(Json::objectValue);
    int index = 0;
    for (const auto& [name, param] : net.named_weights()) {
        torch::Tensor t = param.detach().to(torch::kCPU, torch::kFloat32).contiguous();

        Json::Value entry(Json::objectValue);
        entry["dtype"] = "F32";

        Json::Value shape(Json::arrayValue);
        for (int64_t d : t.sizes()) shape.append(Json::Int64(d));
        entry["shape"] = shape;

        Json::Value data(Json::arrayValue);
        const float* p = t.data_ptr<float>();
        for (int64_t i = 0; i < t.numel(); ++i) data.append(static_cast<double>(p[i]));
        entry["data"] = data;

        tensors["layer_" + std::to_string(index) + "_" + name] = entry;
        ++index;
    }

    Json::Value root(Json::objectValue);
    root["metadata"] = meta;
    root["tensors"] = tensors;
    root["version"] = kVersion;
    return root;
}

std::string ModelExporter::serialize(const Json::Value& document) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["precision"] = 17;
    builder["precisionType"] = "significant";
    return Json::writeString(builder, document);
}

ExportResult ModelExporter::exportToFile(const ControllerNetImpl& net, ExportMetadata metadata,
                                         const std::string& directory) {
    ExportResult result;
    try {
        const auto now = std::chrono::system_clock::now();
        if (metadata.createdAt.empty()) metadata.createdAt = isoTimestamp(now);

        std::filesystem::path dir(directory.empty() ? "." : directory);
        std::filesystem::create_directories(dir);

        result.filename = defaultFilename(metadata.robotType, now);
        std::filesystem::path path = dir / result.filename;

        std::ofstream out(path);
        if (!out) {
            throw UprightError(ErrorCode::ExportError, path.string(), "Cannot open file for writing");
        }
        out << serialize(toJson(net, metadata));
        out.close();
        if (!out) {
            throw UprightError(ErrorCode::ExportError, path.string(), "Write failed");
        }

        result.path = path.string();
        result.success = true;
        LOG_INFO("[Export] Model exported: " << result.path);
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
        LOG_ERROR("[Export] Export failed: " << e.what());
    }
    return result;
}

WeightDocument ModelExporter::parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw UprightError(ErrorCode::ImportError, "Invalid JSON: " + errors);
    }
    if (!root.isObject()) {
        throw UprightError(ErrorCode::ImportError, "Document root is not an object");
    }

    WeightDocument doc;
    doc.version = require(root, "version", "document").asString();

    const Json::Value& meta = require(root, "metadata", "document");
    doc.metadata.robotType = require(meta, "robot_type", "metadata").asString();
    doc.metadata.robotName = meta.get("robot_name", "").asString();
    doc.metadata.sensorCount = require(meta, "sensor_count", "metadata").asInt();
    doc.metadata.motorCount = require(meta, "motor_count", "metadata").asInt();
    doc.metadata.trainingSamples = meta.get("training_samples", 0).asUInt64();
    doc.metadata.modelName = meta.get("model_name", "").asString();
    doc.metadata.createdAt = meta.get("created_at", "").asString();

    const Json::Value& tensors = require(root, "tensors", "document");
    if (!tensors.isObject()) {
        throw UprightError(ErrorCode::ImportError, "'tensors' is not an object");
    }

    std::vector<std::pair<int, NamedTensor>> ordered;
    for (const auto& name : tensors.getMemberNames()) {
        const Json::Value& entry = tensors[name];

        NamedTensor tensor;
        tensor.name = name;
        int index = 0;
        if (!split_tensor_name(name, index, tensor.parameter)) {
            throw UprightError(ErrorCode::ImportError, name, "Tensor name is not layer_<index>_<name>");
        }
        if (require(entry, "dtype", name).asString() != "F32") {
            throw UprightError(ErrorCode::ImportError, name, "Only F32 tensors are supported");
        }

        for (const auto& d : require(entry, "shape", name)) {
            if (!d.isIntegral() || d.asInt64() < 0) {
                throw UprightError(ErrorCode::ImportError, name, "Invalid shape entry");
            }
            tensor.shape.push_back(d.asInt64());
        }

        const Json::Value& data = require(entry, "data", name);
        tensor.data.reserve(data.size());
        for (const auto& v : data) {
            if (!v.isNumeric()) {
                throw UprightError(ErrorCode::ImportError, name, "Non-numeric tensor data");
            }
            tensor.data.push_back(static_cast<float>(v.asDouble()));
        }
        if (!shape_holds(tensor.shape, tensor.data.size())) {
            throw UprightError(ErrorCode::ImportError, name, "Data length does not match shape");
        }

        ordered.emplace_back(index, std::move(tensor));
    }

    std::sort(ordered.begin(), ordered.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    for (auto& item : ordered) {
        doc.tensors.push_back(std::move(item.second));
    }
    return doc;
}

WeightDocument ModelExporter::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw UprightError(ErrorCode::ImportError, path, "Cannot open weight document");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return parse(buffer.str());
    } catch (const UprightError& e) {
        throw UprightError(e.code(), path, e.message());
    }
}

std::unordered_map<std::string, torch::Tensor> ModelExporter::toStateDict(const WeightDocument& document) {
    std::unordered_map<std::string, torch::Tensor> state;
    for (const auto& tensor : document.tensors) {
        state[tensor.parameter] = tensor.toTensor();
    }
    return state;
}

} // namespace upright
