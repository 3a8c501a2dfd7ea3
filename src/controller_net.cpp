#include "upright/controller_net.hpp"
#include "upright/error.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace upright {

namespace {

void xavier_init(torch::nn::Linear& layer) {
    torch::nn::init::xavier_uniform_(layer->weight);
    torch::nn::init::zeros_(layer->bias);
}

std::string shape_string(const torch::Tensor& t) {
    std::ostringstream os;
    os << t.sizes();
    return os.str();
}

} // namespace

ControllerNetImpl::ControllerNetImpl(int num_sensors, int num_motors, const std::vector<int>& hidden, double dropout)
    : num_sensors_(num_sensors),
      num_motors_(num_motors),
      hidden_(hidden),
      dropout_rate_(dropout) {

    if (num_sensors <= 0 || num_motors <= 0 || hidden.empty()) {
        throw UprightError(ErrorCode::InvalidArgument,
            "Controller network needs positive input/output widths and at least one hidden layer");
    }

    int in = num_sensors;
    for (size_t i = 0; i < hidden.size(); ++i) {
        auto layer = register_module("fc" + std::to_string(i + 1), torch::nn::Linear(in, hidden[i]));
        hidden_layers_.push_back(layer);
        in = hidden[i];
    }
    output_layer_ = register_module("out", torch::nn::Linear(in, num_motors));
    dropout_ = register_module("dropout", torch::nn::Dropout(torch::nn::DropoutOptions(dropout)));

    initialize_weights();
    eval();
}

void ControllerNetImpl::initialize_weights() {
    torch::NoGradGuard no_grad;
    for (auto& layer : hidden_layers_) {
        xavier_init(layer);
    }
    xavier_init(output_layer_);
}

torch::Tensor ControllerNetImpl::forward(torch::Tensor x) {
    const size_t last = hidden_layers_.size() - 1;
    for (size_t i = 0; i < hidden_layers_.size(); ++i) {
        x = torch::relu(hidden_layers_[i]->forward(x));
        if (i < last) {
            x = dropout_->forward(x);
        }
    }
    return torch::tanh(output_layer_->forward(x));
}

Eigen::VectorXf ControllerNetImpl::no_grad_forward(const Eigen::VectorXf& sensors) {
    torch::NoGradGuard no_grad;

    Eigen::VectorXf input = Eigen::VectorXf::Zero(num_sensors_);
    const Eigen::Index n = std::min<Eigen::Index>(num_sensors_, sensors.size());
    input.head(n) = sensors.head(n);

    auto x = torch::from_blob(input.data(), {1, num_sensors_}, torch::kFloat32).clone();

    const bool was_training = is_training();
    if (was_training) eval();
    auto out = forward(x).contiguous();
    if (was_training) train();

    Eigen::VectorXf result(num_motors_);
    std::memcpy(result.data(), out.data_ptr<float>(), num_motors_ * sizeof(float));
    return result;
}

std::vector<std::pair<std::string, torch::Tensor>> ControllerNetImpl::named_weights() const {
    std::vector<std::pair<std::string, torch::Tensor>> weights;
    for (const auto& item : named_parameters()) {
        weights.emplace_back(item.key(), item.value());
    }
    return weights;
}

void ControllerNetImpl::load_state_dict(const std::unordered_map<std::string, torch::Tensor>& state_dict) {
    torch::NoGradGuard no_grad;

    // Validate everything before touching a single parameter
    for (const auto& item : named_parameters()) {
        auto it = state_dict.find(item.key());
        if (it == state_dict.end()) {
            throw UprightError(ErrorCode::ImportError, item.key(), "Missing parameter");
        }
        if (!it->second.sizes().equals(item.value().sizes())) {
            throw UprightError(ErrorCode::DimensionMismatch, item.key(),
                "Expected shape " + shape_string(item.value()) + ", got " + shape_string(it->second));
        }
    }

    for (auto& item : named_parameters()) {
        const torch::Tensor& src = state_dict.at(item.key());
        item.value().copy_(src.to(torch::kFloat32));
    }
}

std::shared_ptr<ControllerNetImpl> ControllerNetImpl::clone_network() const {
    auto copy = std::make_shared<ControllerNetImpl>(num_sensors_, num_motors_, hidden_, dropout_rate_);
    std::unordered_map<std::string, torch::Tensor> weights;
    for (const auto& [name, tensor] : named_weights()) {
        weights[name] = tensor.detach().clone();
    }
    copy->load_state_dict(weights);
    return copy;
}

int64_t ControllerNetImpl::parameter_count() const {
    int64_t count = 0;
    for (const auto& p : parameters()) {
        count += p.numel();
    }
    return count;
}

} // namespace upright
