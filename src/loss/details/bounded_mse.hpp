#ifndef MOLPROP_LOSS_BOUNDED_MSE_HPP
#define MOLPROP_LOSS_BOUNDED_MSE_HPP

#include <torch/torch.h>

#include "helper.hpp"

namespace Molprop::Loss::Details {

    namespace F = torch::nn::functional;

    struct BoundedMSEOptions {};

    struct BoundedMSEDescriptor {
        BoundedMSEOptions options{};
    };

    /*
     * Squared error for censored targets. A target flagged `less_than_target` is an upper bound
     * on the true value, so a prediction under it is pulled up onto the target and costs nothing.
     * `greater_than_target` is the mirror case. Unflagged targets behave like plain MSE.
     */
    inline torch::Tensor compute(const BoundedMSEDescriptor&,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const Auxiliary& auxiliary)
    {
        require_defined(prediction, target, "Bounded MSE");
        const auto& less_than = require_auxiliary(auxiliary.less_than_target, "Bounded MSE", "less_than_target");
        const auto& greater_than = require_auxiliary(auxiliary.greater_than_target, "Bounded MSE", "greater_than_target");
        require_same_shape(prediction, less_than, "Bounded MSE", "less_than_target");
        require_same_shape(prediction, greater_than, "Bounded MSE", "greater_than_target");

        auto tgt = target.to(prediction.device(), prediction.scalar_type());

        auto pred = torch::where(torch::logical_and(prediction < tgt, as_mask(less_than, prediction)), tgt, prediction);
        pred = torch::where(torch::logical_and(pred > tgt, as_mask(greater_than, prediction)), tgt, pred);

        return F::mse_loss(pred, tgt, F::MSELossFuncOptions().reduction(torch::kNone));
    }

}

#endif // MOLPROP_LOSS_BOUNDED_MSE_HPP
