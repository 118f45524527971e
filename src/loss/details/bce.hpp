#ifndef MOLPROP_LOSS_BCE_HPP
#define MOLPROP_LOSS_BCE_HPP

#include <torch/torch.h>
#include <vector>

#include "helper.hpp"

namespace Molprop::Loss::Details {

    struct BCEWithLogitsOptions {
        std::vector<double> pos_weight{};
    };

    struct BCEWithLogitsDescriptor {
        BCEWithLogitsOptions options{};
    };

    inline torch::Tensor compute(const BCEWithLogitsDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const Auxiliary& = {})
    {
        require_defined(prediction, target, "Binary cross-entropy");
        auto opts = torch::nn::functional::BinaryCrossEntropyWithLogitsFuncOptions{}.reduction(torch::kNone);

        if (!descriptor.options.pos_weight.empty()) {
            auto pos_weight_tensor = torch::tensor(
                descriptor.options.pos_weight,
                torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device()));
            opts = opts.pos_weight(pos_weight_tensor);
        }

        return torch::nn::functional::binary_cross_entropy_with_logits(
            prediction,
            target.to(prediction.device(), prediction.scalar_type()),
            opts);
    }

}

#endif // MOLPROP_LOSS_BCE_HPP
