#pragma once

#include "upright/controller_net.hpp"
#include "upright/experience_buffer.hpp"
#include "upright/model_exporter.hpp"
#include "upright/morphology.hpp"
#include "upright/training_worker.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace upright {

struct TrainingConfig {
    float fitnessThreshold = 20.0f;   // samples must score above this
    size_t topN = 200;                // best samples kept after sorting
    size_t minSamples = 3;            // qualifying samples needed to train
    float replicationUnit = 25.0f;    // one extra copy per this much fitness
    int epochs = 10;
    int batchSize = 32;
    double learningRate = 0.0005;
    double dropout = 0.2;
    bool async = true;                // fit on the worker thread
    int64_t seed = -1;                // torch::manual_seed when >= 0
};

enum class FitStatus {
    Started,       // queued on the training worker
    Trained,
    InsufficientData,
    Busy,          // a fit is already in flight
    NoModel,
    Discarded,     // finished after a reset; result dropped
    Failed
};

const char* to_string(FitStatus status);

struct FitResult {
    FitStatus status = FitStatus::NoModel;
    size_t qualifyingSamples = 0;
    size_t trainingRows = 0;          // after replication
    float finalLoss = 0.0f;
    std::string error;

    bool trained() const { return status == FitStatus::Trained; }
};

struct ImportResult {
    bool success = false;
    size_t tensorsLoaded = 0;
    std::string error;
};

/**
 * Owns the controller network of one robot instance: creation, training,
 * disposal and persistence.
 *
 * Training never writes into the live network. A fit trains a copy on a
 * snapshot of the samples; the copy replaces the live network only if no
 * reset happened in between (tracked by a generation counter). A reset while
 * a fit is in flight lets the fit finish and silently drops its result.
 */
class ModelManager {
public:
    ModelManager(const Morphology& morphology, const TrainingConfig& config = TrainingConfig());
    ~ModelManager();

    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    // Fresh network sized for the morphology
    void create();

    // Release the network and build a new one; buffer owners keep their data
    void reset();

    // Release the network without replacement
    void dispose();

    bool isInitialized() const { return net_ != nullptr; }
    bool isTraining() const { return training_.load(); }
    uint64_t generation() const { return generation_; }

    const ControllerNet& network() const { return net_; }

    // Throws UprightError(ModelUnavailable) without a network
    Eigen::VectorXf predict(const Eigen::VectorXf& sensors);

    /**
     * Curate the samples and train synchronously on the calling thread.
     * InsufficientData leaves the network untouched.
     */
    FitResult fit(const std::vector<ExperienceSample>& samples);

    /**
     * Curate on the calling thread, then train on the worker.
     * @return Started, or NoModel / Busy / InsufficientData without queuing anything
     */
    FitResult startFit(const std::vector<ExperienceSample>& samples);

    // Non-blocking: returns the finished fit once, after installing its weights
    std::optional<FitResult> poll();

    // Block until the worker is idle, then poll()
    std::optional<FitResult> waitForFit();

    // Selection + fitness-proportional replication, exposed for inspection
    std::vector<ExperienceSample> curate(const std::vector<ExperienceSample>& samples, size_t* qualifying = nullptr) const;

    ExportResult exportModel(const std::string& directory, size_t trainingSamples) const;

    // Validates robot type, counts and tensor shapes before loading
    ImportResult importModel(const std::string& path);

    const Morphology& morphology() const { return morphology_; }
    const TrainingConfig& config() const { return config_; }
    const std::string& modelName() const { return modelName_; }

private:
    // Trains `net` in place; catches every std::exception into a Failed result
    FitResult trainNetwork(ControllerNetImpl& net, const std::vector<ExperienceSample>& curated, size_t qualifying) const;

    struct PendingFit {
        FitResult result;
        ControllerNet net;
        uint64_t generation = 0;
    };

    Morphology morphology_;
    TrainingConfig config_;
    std::string modelName_;

    ControllerNet net_;
    uint64_t generation_ = 0;
    std::atomic<bool> training_{false};

    std::mutex pending_mutex_;
    std::optional<PendingFit> pending_;

    // Declared last so queued jobs finish before the members they touch go away
    std::unique_ptr<TrainingWorker> worker_;
};

} // namespace upright
