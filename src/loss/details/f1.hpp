#ifndef MOLPROP_LOSS_F1_HPP
#define MOLPROP_LOSS_F1_HPP

#include <sstream>
#include <stdexcept>

#include <torch/torch.h>

#include "helper.hpp"
#include "mcc.hpp"

namespace Molprop::Loss::Details {

    struct F1ClassOptions {};

    struct F1ClassDescriptor {
        F1ClassOptions options{};
    };

    struct F1MulticlassOptions {};

    struct F1MulticlassDescriptor {
        F1MulticlassOptions options{};
    };

    // 1 - 2TP / (2TP + FN + FP) per task column, from soft confusion entries.
    inline torch::Tensor compute(const F1ClassDescriptor&,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const Auxiliary& auxiliary)
    {
        require_defined(prediction, target, "F1");
        const auto& data_weights = require_auxiliary(auxiliary.data_weights, "F1", "data_weights");
        const auto& mask = require_auxiliary(auxiliary.mask, "F1", "mask");
        require_same_shape(prediction, target, "F1", "target");
        require_same_shape(prediction, mask, "F1", "mask");

        auto tgt = target.to(prediction.device(), prediction.scalar_type());
        auto scale = as_row_factor(data_weights, prediction) * as_factor(mask, prediction);

        auto true_positive = (tgt * prediction * scale).sum(0);
        auto false_positive = ((1 - tgt) * prediction * scale).sum(0);
        auto false_negative = (tgt * (1 - prediction) * scale).sum(0);

        return 1 - (2 * true_positive / (2 * true_positive + false_negative + false_positive));
    }

    // Scalar over the batch. FN sums 1 - p_true * w * m over the rows.
    inline torch::Tensor compute(const F1MulticlassDescriptor&,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const Auxiliary& auxiliary)
    {
        require_defined(prediction, target, "Multiclass F1");
        const auto& data_weights = require_auxiliary(auxiliary.data_weights, "Multiclass F1", "data_weights");
        const auto& mask = require_auxiliary(auxiliary.mask, "Multiclass F1", "mask");
        if (prediction.dim() != 2 || target.dim() != 1 || target.size(0) != prediction.size(0)) {
            std::ostringstream message;
            message << "Multiclass F1 loss expects predictions (batch, classes) and class indices (batch,), got "
                    << prediction.sizes() << " and " << target.sizes() << '.';
            throw std::invalid_argument(message.str());
        }

        auto weights = as_factor(data_weights, prediction).reshape({-1});
        auto row_mask = as_factor(mask, prediction).reshape({-1});
        auto indices = target.to(prediction.device(), torch::kLong).unsqueeze(1);
        auto true_class_probability = prediction.gather(1, indices).squeeze(1);

        auto true_positive = (true_class_probability * weights * row_mask).sum();
        auto predicted = (prediction * weights.unsqueeze(1) * row_mask.unsqueeze(1)).sum();
        auto false_negative = (1 - true_class_probability * weights * row_mask).sum();

        return 1 - (2 * true_positive / (true_positive + false_negative + predicted));
    }

}

#endif // MOLPROP_LOSS_F1_HPP
