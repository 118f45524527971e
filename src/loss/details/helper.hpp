#ifndef MOLPROP_LOSS_HELPER_HPP
#define MOLPROP_LOSS_HELPER_HPP

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <torch/torch.h>

namespace Molprop::Loss::Details {

    // Optional tensors that travel with a batch. Each loss reads only the fields it needs.
    struct Auxiliary {
        std::optional<torch::Tensor> mask{};
        std::optional<torch::Tensor> data_weights{};
        std::optional<torch::Tensor> less_than_target{};
        std::optional<torch::Tensor> greater_than_target{};
    };

    inline void require_defined(const torch::Tensor& prediction, const torch::Tensor& target, std::string_view loss) {
        if (!prediction.defined() || !target.defined()) {
            std::ostringstream message;
            message << loss << " loss requires defined prediction and target tensors.";
            throw std::invalid_argument(message.str());
        }
    }

    inline const torch::Tensor& require_auxiliary(const std::optional<torch::Tensor>& tensor,
                                                  std::string_view loss,
                                                  std::string_view field) {
        if (!tensor || !tensor->defined()) {
            std::ostringstream message;
            message << loss << " loss requires the '" << field << "' tensor.";
            throw std::invalid_argument(message.str());
        }
        return *tensor;
    }

    inline void require_same_shape(const torch::Tensor& lhs, const torch::Tensor& rhs, std::string_view loss, std::string_view field) {
        if (lhs.sizes() != rhs.sizes()) {
            std::ostringstream message;
            message << loss << " loss expects '" << field << "' with shape " << lhs.sizes()
                    << ", got " << rhs.sizes() << '.';
            throw std::invalid_argument(message.str());
        }
    }

    // Boolean mask on the reference tensor's device.
    inline torch::Tensor as_mask(const torch::Tensor& mask, const torch::Tensor& reference) {
        return mask.to(reference.device(), torch::kBool);
    }

    // Mask or weights as a multiplier matching the reference dtype and device.
    inline torch::Tensor as_factor(const torch::Tensor& factor, const torch::Tensor& reference) {
        return factor.to(reference.device(), reference.scalar_type());
    }

    // Floors values below `threshold`, zeros the masked bins and scales every row to sum to one.
    // A fully masked row has a zero sum and comes out as NaN.
    inline torch::Tensor normalize_spectra(const torch::Tensor& model_spectra,
                                           const torch::Tensor& mask,
                                           const std::optional<double>& threshold) {
        auto spectra = model_spectra;
        if (threshold.has_value()) {
            auto floor = torch::full_like(spectra, *threshold);
            spectra = torch::where(spectra < *threshold, floor, spectra);
        }
        spectra = torch::where(mask, spectra, torch::zeros_like(spectra));
        auto row_sum = spectra.sum(/*dim=*/1, /*keepdim=*/true);
        return spectra / row_sum;
    }

    inline void require_spectra(const torch::Tensor& model_spectra,
                                const torch::Tensor& target_spectra,
                                const torch::Tensor& mask,
                                std::string_view loss) {
        if (model_spectra.dim() != 2) {
            std::ostringstream message;
            message << loss << " loss expects spectra shaped (batch, spectrum_length), got " << model_spectra.sizes() << '.';
            throw std::invalid_argument(message.str());
        }
        require_same_shape(model_spectra, target_spectra, loss, "target_spectra");
        require_same_shape(model_spectra, mask, loss, "mask");
    }
}

#endif // MOLPROP_LOSS_HELPER_HPP
