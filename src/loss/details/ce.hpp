#ifndef MOLPROP_LOSS_CE_HPP
#define MOLPROP_LOSS_CE_HPP

#include <torch/torch.h>

#include "helper.hpp"

namespace Molprop::Loss::Details {
    struct CrossEntropyOptions {
        double label_smoothing{0.0};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    // Scores (batch, classes) against class indices (batch,). One loss value per row.
    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const Auxiliary& = {}) {
        require_defined(prediction, target, "Cross-entropy");
        auto opts = torch::nn::functional::CrossEntropyFuncOptions{}
            .reduction(torch::kNone)
            .label_smoothing(descriptor.options.label_smoothing);
        return torch::nn::functional::cross_entropy(prediction, target.to(prediction.device(), torch::kLong), opts);
    }
}
#endif //MOLPROP_LOSS_CE_HPP
