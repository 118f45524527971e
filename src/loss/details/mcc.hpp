#ifndef MOLPROP_LOSS_MCC_HPP
#define MOLPROP_LOSS_MCC_HPP

#include <sstream>
#include <stdexcept>

#include <torch/torch.h>

#include "helper.hpp"

namespace Molprop::Loss::Details {

    struct MCCClassOptions {};

    struct MCCClassDescriptor {
        MCCClassOptions options{};
    };

    struct MCCMulticlassOptions {};

    struct MCCMulticlassDescriptor {
        MCCMulticlassOptions options{};
    };

    // Row weights shaped (batch, 1) so they broadcast over the task or class axis.
    inline torch::Tensor as_row_factor(const torch::Tensor& factor, const torch::Tensor& reference) {
        return as_factor(factor, reference).reshape({-1, 1});
    }

    /*
     * Soft Matthews correlation per task column, returned as 1 - MCC with shape (tasks,).
     * predictions are probabilities (batch, tasks); targets hold 0/1 labels of the same shape.
     * The confusion entries are sums of products, so the loss stays differentiable.
     * Columns without variation in predictions or targets have a zero denominator and yield NaN.
     */
    inline torch::Tensor compute(const MCCClassDescriptor&,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const Auxiliary& auxiliary)
    {
        require_defined(prediction, target, "MCC");
        const auto& data_weights = require_auxiliary(auxiliary.data_weights, "MCC", "data_weights");
        const auto& mask = require_auxiliary(auxiliary.mask, "MCC", "mask");
        require_same_shape(prediction, target, "MCC", "target");
        require_same_shape(prediction, mask, "MCC", "mask");

        auto tgt = target.to(prediction.device(), prediction.scalar_type());
        auto scale = as_row_factor(data_weights, prediction) * as_factor(mask, prediction);

        auto true_positive = (tgt * prediction * scale).sum(0);
        auto false_positive = ((1 - tgt) * prediction * scale).sum(0);
        auto false_negative = (tgt * (1 - prediction) * scale).sum(0);
        auto true_negative = ((1 - tgt) * (1 - prediction) * scale).sum(0);

        auto numerator = true_positive * true_negative - false_positive * false_negative;
        auto denominator = torch::sqrt((true_positive + false_positive)
                                       * (true_positive + false_negative)
                                       * (true_negative + false_positive)
                                       * (true_negative + false_negative));
        return 1 - numerator / denominator;
    }

    /*
     * Soft multiclass MCC over the whole batch, returned as a scalar 1 - MCC.
     * predictions are class probabilities (batch, classes), targets are class indices (batch,),
     * data_weights and mask are per row (batch,).
     */
    inline torch::Tensor compute(const MCCMulticlassDescriptor&,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const Auxiliary& auxiliary)
    {
        require_defined(prediction, target, "Multiclass MCC");
        const auto& data_weights = require_auxiliary(auxiliary.data_weights, "Multiclass MCC", "data_weights");
        const auto& mask = require_auxiliary(auxiliary.mask, "Multiclass MCC", "mask");
        if (prediction.dim() != 2 || target.dim() != 1 || target.size(0) != prediction.size(0)) {
            std::ostringstream message;
            message << "Multiclass MCC loss expects predictions (batch, classes) and class indices (batch,), got "
                    << prediction.sizes() << " and " << target.sizes() << '.';
            throw std::invalid_argument(message.str());
        }

        auto bin_targets = torch::one_hot(target.to(prediction.device(), torch::kLong), prediction.size(1))
                               .to(prediction.scalar_type());
        auto scale = as_row_factor(data_weights, prediction) * as_row_factor(mask, prediction);

        auto weighted_prediction = prediction * scale;
        auto weighted_targets = bin_targets * scale;

        auto correct = (weighted_prediction * bin_targets).sum();
        auto samples = weighted_prediction.sum();
        auto predicted_per_class = weighted_prediction.sum(0);
        auto true_per_class = weighted_targets.sum(0);

        auto pt = (predicted_per_class * true_per_class).sum();
        auto p2 = predicted_per_class.pow(2).sum();
        auto t2 = true_per_class.pow(2).sum();

        auto numerator = correct * samples - pt;
        auto denominator = torch::sqrt((samples.pow(2) - p2) * (samples.pow(2) - t2));
        return 1 - numerator / denominator;
    }

}

#endif // MOLPROP_LOSS_MCC_HPP
