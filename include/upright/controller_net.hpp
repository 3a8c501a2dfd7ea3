#pragma once

#include <torch/torch.h>
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace upright {

/**
 * Feed-forward motor controller: sensors -> ReLU hidden layers -> tanh motors.
 *
 * Dropout follows every hidden layer except the last. Outputs are bounded to
 * [-1, 1] by the tanh head, so predictions are valid motor commands as-is.
 *
 * Usage:
 *   auto net = make_controller_net(28, 8, {64, 32, 16});
 *   Eigen::VectorXf action = net->no_grad_forward(sensors);
 */
class ControllerNetImpl : public torch::nn::Module {
public:
    /**
     * @param num_sensors Input width (morphology sensor count)
     * @param num_motors Output width (morphology motor count)
     * @param hidden Hidden layer widths, input side first
     * @param dropout Dropout rate between hidden layers
     */
    ControllerNetImpl(int num_sensors, int num_motors, const std::vector<int>& hidden, double dropout = 0.2);

    // Batched forward pass (batch_size, num_sensors) -> (batch_size, num_motors)
    torch::Tensor forward(torch::Tensor x);

    /**
     * Single-sample inference without gradients.
     * Input is padded/truncated to num_sensors. Runs with dropout disabled.
     */
    Eigen::VectorXf no_grad_forward(const Eigen::VectorXf& sensors);

    // Xavier-uniform weights, zero biases
    void initialize_weights();

    // Parameters in registration order ("fc1.weight", "fc1.bias", ...)
    std::vector<std::pair<std::string, torch::Tensor>> named_weights() const;

    /**
     * Copy parameters by name. Every parameter of this network must be present
     * with a matching shape; throws UprightError otherwise.
     */
    void load_state_dict(const std::unordered_map<std::string, torch::Tensor>& state_dict);

    // Fresh network with identical architecture and copied weights
    std::shared_ptr<ControllerNetImpl> clone_network() const;

    int64_t parameter_count() const;

    int num_sensors() const { return num_sensors_; }
    int num_motors() const { return num_motors_; }
    const std::vector<int>& hidden() const { return hidden_; }
    double dropout_rate() const { return dropout_rate_; }

private:
    std::vector<torch::nn::Linear> hidden_layers_;
    torch::nn::Linear output_layer_{nullptr};
    torch::nn::Dropout dropout_{nullptr};

    int num_sensors_;
    int num_motors_;
    std::vector<int> hidden_;
    double dropout_rate_;
};

using ControllerNet = std::shared_ptr<ControllerNetImpl>;

inline ControllerNet make_controller_net(int num_sensors, int num_motors, const std::vector<int>& hidden, double dropout = 0.2) {
    return std::make_shared<ControllerNetImpl>(num_sensors, num_motors, hidden, dropout);
}

} // namespace upright
