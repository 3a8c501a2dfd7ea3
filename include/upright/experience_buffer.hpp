#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <deque>
#include <vector>

namespace upright {

struct ExperienceSample {
    Eigen::VectorXf state;    // sensor values at episode start
    Eigen::VectorXf action;   // final applied action of the episode
    float fitness = 0.0f;     // episode-averaged fitness
};

struct BufferConfig {
    size_t capacity = 1000;   // hard cap
    size_t retain = 800;      // samples kept when the cap is exceeded
};

/**
 * Bounded, time-ordered store of training samples.
 *
 * The first insertion past `capacity` trims the buffer to the `retain` most
 * recent samples. From then on the buffer holds a sliding window of `retain`
 * samples, evicting the oldest first. clear() returns to the untrimmed state.
 */
class ExperienceBuffer {
public:
    using const_iterator = std::deque<ExperienceSample>::const_iterator;

    explicit ExperienceBuffer(const BufferConfig& config = BufferConfig());

    void add(ExperienceSample sample);
    void clear();

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    size_t capacity() const { return config_.capacity; }

    const ExperienceSample& operator[](size_t index) const { return samples_[index]; }
    const ExperienceSample& front() const { return samples_.front(); }
    const ExperienceSample& back() const { return samples_.back(); }
    const_iterator begin() const { return samples_.begin(); }
    const_iterator end() const { return samples_.end(); }

    // Copy for a training job that outlives the current tick
    std::vector<ExperienceSample> snapshot() const;

    // Best sample seen since construction or the last clear(), diagnostics only
    bool hasBest() const { return hasBest_; }
    float bestFitness() const { return bestFitness_; }
    const Eigen::VectorXf& bestAction() const { return bestAction_; }

    size_t totalInserted() const { return inserted_; }
    size_t totalEvicted() const { return evicted_; }

private:
    void evict(size_t count);

    BufferConfig config_;
    std::deque<ExperienceSample> samples_;
    bool windowed_ = false;

    bool hasBest_ = false;
    float bestFitness_ = 0.0f;
    Eigen::VectorXf bestAction_;

    size_t inserted_ = 0;
    size_t evicted_ = 0;
};

} // namespace upright
