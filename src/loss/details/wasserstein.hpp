#ifndef MOLPROP_LOSS_WASSERSTEIN_HPP
#define MOLPROP_LOSS_WASSERSTEIN_HPP

#include <optional>

#include <torch/torch.h>

#include "helper.hpp"

namespace Molprop::Loss::Details {

    struct WassersteinOptions {
        std::optional<double> threshold{};
    };

    struct WassersteinDescriptor {
        WassersteinOptions options{};
    };

    /*
     * First Wasserstein distance on an evenly spaced grid: |CDF_target - CDF_model| per bin.
     * Masked bins are zeroed before normalization only. The running sums are not patched
     * afterwards, so a mismatch accumulated before a masked bin still shows up in it.
     */
    inline torch::Tensor compute(const WassersteinDescriptor& descriptor,
                                 const torch::Tensor& model_spectra,
                                 const torch::Tensor& target_spectra,
                                 const Auxiliary& auxiliary)
    {
        require_defined(model_spectra, target_spectra, "Wasserstein");
        const auto& raw_mask = require_auxiliary(auxiliary.mask, "Wasserstein", "mask");
        require_spectra(model_spectra, target_spectra, raw_mask, "Wasserstein");

        auto model = normalize_spectra(model_spectra, as_mask(raw_mask, model_spectra), descriptor.options.threshold);
        auto target = target_spectra.to(model_spectra.device(), model_spectra.scalar_type());

        auto target_cum = torch::cumsum(target, /*dim=*/1);
        auto model_cum = torch::cumsum(model, /*dim=*/1);
        return torch::abs(target_cum - model_cum);
    }

}

#endif // MOLPROP_LOSS_WASSERSTEIN_HPP
