#include "upright/experience_buffer.hpp"
#include "upright/error.hpp"
#include "upright/log.hpp"

namespace upright {

ExperienceBuffer::ExperienceBuffer(const BufferConfig& config)
    : config_(config) {
    if (config_.capacity == 0 || config_.retain == 0 || config_.retain > config_.capacity) {
        throw UprightError(ErrorCode::InvalidArgument,
            "Buffer needs 0 < retain <= capacity");
    }
}

void ExperienceBuffer::add(ExperienceSample sample) {
    if (!hasBest_ || sample.fitness > bestFitness_) {
        hasBest_ = true;
        bestFitness_ = sample.fitness;
        bestAction_ = sample.action;
    }

    samples_.push_back(std::move(sample));
    ++inserted_;

    if (samples_.size() > config_.capacity) {
        evict(samples_.size() - config_.retain);
        windowed_ = true;
        LOG_VERBOSE("[Buffer] Cap " << config_.capacity << " exceeded, keeping last " << config_.retain);
    } else if (windowed_ && samples_.size() > config_.retain) {
        evict(samples_.size() - config_.retain);
    }
}

void ExperienceBuffer::evict(size_t count) {
    for (size_t i = 0; i < count && !samples_.empty(); ++i) {
        samples_.pop_front();
        ++evicted_;
    }
}

void ExperienceBuffer::clear() {
    samples_.clear();
    windowed_ = false;
    hasBest_ = false;
    bestFitness_ = 0.0f;
    bestAction_.resize(0);
    inserted_ = 0;
    evicted_ = 0;
}

std::vector<ExperienceSample> ExperienceBuffer::snapshot() const {
    return std::vector<ExperienceSample>(samples_.begin(), samples_.end());
}

} // namespace upright
