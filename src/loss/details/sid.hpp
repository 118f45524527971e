#ifndef MOLPROP_LOSS_SID_HPP
#define MOLPROP_LOSS_SID_HPP

#include <optional>

#include <torch/torch.h>

#include "helper.hpp"

namespace Molprop::Loss::Details {

    struct SIDOptions {
        // Floor applied to model values before normalization; the log ratio needs them positive.
        std::optional<double> threshold{};
    };

    struct SIDDescriptor {
        SIDOptions options{};
    };

    /*
     * Spectral information divergence, m * log(m / t) + t * log(t / m) per bin.
     * model_spectra is normalized over the unmasked bins first. target_spectra is expected to be
     * normalized already. Masked bins hold 1 on both sides, so they contribute log(1) = 0.
     * Output shape: (batch, spectrum_length).
     */
    inline torch::Tensor compute(const SIDDescriptor& descriptor,
                                 const torch::Tensor& model_spectra,
                                 const torch::Tensor& target_spectra,
                                 const Auxiliary& auxiliary)
    {
        require_defined(model_spectra, target_spectra, "SID");
        const auto& raw_mask = require_auxiliary(auxiliary.mask, "SID", "mask");
        require_spectra(model_spectra, target_spectra, raw_mask, "SID");

        auto mask = as_mask(raw_mask, model_spectra);
        auto one_sub = torch::ones_like(model_spectra);

        auto model = normalize_spectra(model_spectra, mask, descriptor.options.threshold);
        auto target = torch::where(mask, target_spectra.to(model_spectra.device(), model_spectra.scalar_type()), one_sub);
        model = torch::where(mask, model, one_sub);

        return torch::log(model / target) * model + torch::log(target / model) * target;
    }

}

#endif // MOLPROP_LOSS_SID_HPP
