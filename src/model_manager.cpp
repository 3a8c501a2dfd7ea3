#include "upright/model_manager.hpp"
#include "upright/error.hpp"
#include "upright/log.hpp"
#include "upright/sensor_encoder.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace upright {

namespace {

std::string fresh_model_name(const std::string& displayName) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return displayName + "_model_" + std::to_string(millis);
}

} // namespace

const char* to_string(FitStatus status) {
    switch (status) {
        case FitStatus::Started:          return "started";
        case FitStatus::Trained:          return "trained";
        case FitStatus::InsufficientData: return "insufficient data";
        case FitStatus::Busy:             return "busy";
        case FitStatus::NoModel:          return "no model";
        case FitStatus::Discarded:        return "discarded";
        case FitStatus::Failed:           return "failed";
        default:                          return "unknown";
    }
}

ModelManager::ModelManager(const Morphology& morphology, const TrainingConfig& config)
    : morphology_(morphology),
      config_(config),
      worker_(std::make_unique<TrainingWorker>()) {
    if (config_.epochs <= 0 || config_.batchSize <= 0 || config_.learningRate <= 0.0) {
        throw UprightError(ErrorCode::InvalidArgument,
            "Training needs positive epochs, batch size and learning rate");
    }
}

ModelManager::~ModelManager() = default;

void ModelManager::create() {
    if (config_.seed >= 0) {
        torch::manual_seed(static_cast<uint64_t>(config_.seed));
    }

    net_ = make_controller_net(morphology_.sensorCount, morphology_.motorCount,
                               hiddenLayers(morphology_.capacityTier), config_.dropout);
    ++generation_;
    modelName_ = fresh_model_name(morphology_.displayName);

    LOG_INFO("[ModelManager] " << morphology_.displayName << " model created ("
             << to_string(morphology_.capacityTier) << ")");
    LOG_INFO("[ModelManager] Parameters: " << net_->parameter_count()
             << ", sensor inputs: " << morphology_.sensorCount
             << ", motor outputs: " << morphology_.motorCount);
}

void ModelManager::dispose() {
    if (net_) {
        LOG_VERBOSE("[ModelManager] Disposing network (generation " << generation_ << ")");
    }
    net_.reset();
    ++generation_;
}

void ModelManager::reset() {
    if (isTraining()) {
        LOG_INFO("[ModelManager] Reset during training, in-flight result will be discarded");
    }
    dispose();
    create();
}

Eigen::VectorXf ModelManager::predict(const Eigen::VectorXf& sensors) {
    if (!net_) {
        throw UprightError(ErrorCode::ModelUnavailable, "predict() called before create()");
    }
    return net_->no_grad_forward(sensors);
}

std::vector<ExperienceSample> ModelManager::curate(const std::vector<ExperienceSample>& samples,
                                                   size_t* qualifying) const {
    std::vector<const ExperienceSample*> selected;
    for (const auto& s : samples) {
        if (s.fitness > config_.fitnessThreshold) {
            selected.push_back(&s);
        }
    }
    if (qualifying != nullptr) {
        *qualifying = selected.size();
    }

    std::stable_sort(selected.begin(), selected.end(),
        [](const ExperienceSample* a, const ExperienceSample* b) { return a->fitness > b->fitness; });
    if (selected.size() > config_.topN) {
        selected.resize(config_.topN);
    }

    // Higher fitness -> more copies in the training set
    std::vector<ExperienceSample> curated;
    for (const ExperienceSample* s : selected) {
        int copies = std::max(1, static_cast<int>(std::ceil(s->fitness / config_.replicationUnit)));
        for (int i = 0; i < copies; ++i) {
            curated.push_back(*s);
        }
    }
    return curated;
}

FitResult ModelManager::trainNetwork(ControllerNetImpl& net, const std::vector<ExperienceSample>& curated,
                                     size_t qualifying) const {
    FitResult result;
    result.qualifyingSamples = qualifying;
    result.trainingRows = curated.size();

    try {
        const int64_t rows = static_cast<int64_t>(curated.size());
        const int sensors = morphology_.sensorCount;
        const int motors = morphology_.motorCount;

        torch::Tensor xs = torch::zeros({rows, sensors}, torch::kFloat32);
        torch::Tensor ys = torch::zeros({rows, motors}, torch::kFloat32);
        for (int64_t r = 0; r < rows; ++r) {
            Eigen::VectorXf state = fitToWidth(curated[r].state, sensors);
            Eigen::VectorXf action = fitToWidth(curated[r].action, motors);
            xs[r].copy_(torch::from_blob(state.data(), {sensors}, torch::kFloat32));
            ys[r].copy_(torch::from_blob(action.data(), {motors}, torch::kFloat32));
        }

        net.train();
        torch::optim::Adam optimizer(net.parameters(), torch::optim::AdamOptions(config_.learningRate));

        float epochLoss = 0.0f;
        for (int epoch = 0; epoch < config_.epochs; ++epoch) {
            auto order = torch::randperm(rows, torch::kLong);
            double lossSum = 0.0;
            int batches = 0;

            for (int64_t start = 0; start < rows; start += config_.batchSize) {
                const int64_t end = std::min<int64_t>(start + config_.batchSize, rows);
                auto index = order.slice(0, start, end);

                optimizer.zero_grad();
                auto prediction = net.forward(xs.index_select(0, index));
                auto loss = torch::mse_loss(prediction, ys.index_select(0, index));
                loss.backward();
                optimizer.step();

                lossSum += loss.item<float>();
                ++batches;
            }

            epochLoss = static_cast<float>(lossSum / std::max(1, batches));
            if (!std::isfinite(epochLoss)) {
                throw UprightError(ErrorCode::InvalidArgument, "Training loss diverged");
            }
            LOG_VERBOSE("[ModelManager] Epoch " << (epoch + 1) << "/" << config_.epochs
                        << " loss " << epochLoss);
        }

        net.eval();
        result.status = FitStatus::Trained;
        result.finalLoss = epochLoss;
    } catch (const std::exception& e) {
        net.eval();
        result.status = FitStatus::Failed;
        result.error = e.what();
    }
    return result;
}

FitResult ModelManager::fit(const std::vector<ExperienceSample>& samples) {
    FitResult result;
    if (!net_) {
        result.status = FitStatus::NoModel;
        return result;
    }
    if (isTraining()) {
        result.status = FitStatus::Busy;
        return result;
    }

    size_t qualifying = 0;
    std::vector<ExperienceSample> curated = curate(samples, &qualifying);
    if (qualifying < config_.minSamples) {
        result.status = FitStatus::InsufficientData;
        result.qualifyingSamples = qualifying;
        LOG_INFO("[ModelManager] Not enough good samples (" << qualifying << " above "
                 << config_.fitnessThreshold << ", need " << config_.minSamples << ")");
        return result;
    }

    training_ = true;
    LOG_INFO("[ModelManager] Training with " << curated.size() << " rows from " << qualifying << " samples...");
    ControllerNet candidate = net_->clone_network();
    result = trainNetwork(*candidate, curated, qualifying);
    if (result.trained()) {
        net_ = candidate;
        LOG_INFO("[ModelManager] Training complete, loss " << result.finalLoss);
    } else {
        LOG_ERROR("[ModelManager] Training failed: " << result.error);
    }
    training_ = false;
    return result;
}

FitResult ModelManager::startFit(const std::vector<ExperienceSample>& samples) {
    FitResult result;
    if (!net_) {
        result.status = FitStatus::NoModel;
        return result;
    }
    if (isTraining()) {
        result.status = FitStatus::Busy;
        return result;
    }

    size_t qualifying = 0;
    std::vector<ExperienceSample> curated = curate(samples, &qualifying);
    result.qualifyingSamples = qualifying;
    result.trainingRows = curated.size();
    if (qualifying < config_.minSamples) {
        result.status = FitStatus::InsufficientData;
        LOG_INFO("[ModelManager] Not enough good samples (" << qualifying << " above "
                 << config_.fitnessThreshold << ", need " << config_.minSamples << ")");
        return result;
    }

    training_ = true;
    LOG_INFO("[ModelManager] Training with " << curated.size() << " rows from " << qualifying
             << " samples in the background...");

    ControllerNet candidate = net_->clone_network();
    const uint64_t generation = generation_;
    worker_->enqueue([this, candidate, curated = std::move(curated), qualifying, generation] {
        FitResult done = trainNetwork(*candidate, curated, qualifying);
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_ = PendingFit{done, candidate, generation};
    });

    result.status = FitStatus::Started;
    return result;
}

std::optional<FitResult> ModelManager::poll() {
    std::optional<PendingFit> done;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!pending_) return std::nullopt;
        done = std::move(pending_);
        pending_.reset();
    }

    FitResult result = done->result;
    if (result.trained()) {
        if (net_ && done->generation == generation_) {
            net_ = done->net;
            LOG_INFO("[ModelManager] Training complete, loss " << result.finalLoss);
        } else {
            result.status = FitStatus::Discarded;
            LOG_INFO("[ModelManager] Discarding training result from a previous model");
        }
    } else {
        LOG_ERROR("[ModelManager] Training failed: " << result.error);
    }

    training_ = false;
    return result;
}

std::optional<FitResult> ModelManager::waitForFit() {
    worker_->wait();
    return poll();
}

ExportResult ModelManager::exportModel(const std::string& directory, size_t trainingSamples) const {
    if (!net_) {
        ExportResult result;
        result.error = "No trained model to export";
        LOG_WARN("[ModelManager] Export requested without a model");
        return result;
    }

    ExportMetadata meta;
    meta.robotType = morphology_.key;
    meta.robotName = morphology_.displayName;
    meta.sensorCount = morphology_.sensorCount;
    meta.motorCount = morphology_.motorCount;
    meta.trainingSamples = trainingSamples;
    meta.modelName = modelName_;
    return ModelExporter::exportToFile(*net_, meta, directory);
}

ImportResult ModelManager::importModel(const std::string& path) {
    ImportResult result;
    try {
        WeightDocument doc = ModelExporter::load(path);
        if (doc.metadata.robotType != morphology_.key) {
            throw UprightError(ErrorCode::ImportError, path,
                "Document is for '" + doc.metadata.robotType + "', controller is '" + morphology_.key + "'");
        }
        if (doc.metadata.sensorCount != morphology_.sensorCount ||
            doc.metadata.motorCount != morphology_.motorCount) {
            throw UprightError(ErrorCode::DimensionMismatch, path, "Sensor/motor counts do not match");
        }

        // A failed load installs nothing
        if (net_) {
            net_->load_state_dict(ModelExporter::toStateDict(doc));
        } else {
            ControllerNet loaded = make_controller_net(morphology_.sensorCount, morphology_.motorCount,
                                                       hiddenLayers(morphology_.capacityTier), config_.dropout);
            loaded->load_state_dict(ModelExporter::toStateDict(doc));
            net_ = loaded;
            modelName_ = fresh_model_name(morphology_.displayName);
        }
        ++generation_;

        result.success = true;
        result.tensorsLoaded = doc.tensors.size();
        LOG_INFO("[ModelManager] Loaded " << result.tensorsLoaded << " tensors from " << path);
    } catch (const std::exception& e) {
        result.error = e.what();
        LOG_ERROR("[ModelManager] Import failed: " << e.what());
    }
    return result;
}

} // namespace upright
