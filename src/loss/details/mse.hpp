#ifndef MOLPROP_LOSS_MSE_HPP
#define MOLPROP_LOSS_MSE_HPP

#include <torch/torch.h>

#include "helper.hpp"

namespace Molprop::Loss::Details {

    namespace F = torch::nn::functional;

    struct MSEOptions {};

    struct MSEDescriptor {
        MSEOptions options{};
    };

    inline torch::Tensor compute(const MSEDescriptor&,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const Auxiliary& = {})
    {
        require_defined(prediction, target, "MSE");
        return F::mse_loss(
            prediction,
            target.to(prediction.device(), prediction.scalar_type()),
            F::MSELossFuncOptions().reduction(torch::kNone));
    }

}

#endif // MOLPROP_LOSS_MSE_HPP
