#ifndef MOLPROP_LOSS_HPP
#define MOLPROP_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/helper.hpp"
#include "details/errors.hpp"
#include "details/mse.hpp"
#include "details/bounded_mse.hpp"
#include "details/bce.hpp"
#include "details/ce.hpp"
#include "details/mcc.hpp"
#include "details/f1.hpp"
#include "details/sid.hpp"
#include "details/wasserstein.hpp"

namespace Molprop::Loss {
    using Auxiliary = Details::Auxiliary;

    using UnsupportedDatasetType = Details::UnsupportedDatasetType;
    using UnsupportedLossFunction = Details::UnsupportedLossFunction;
    using NoDefaultConfigured = Details::NoDefaultConfigured;

    using Descriptor = std::variant<
        Details::MSEDescriptor,
        Details::BoundedMSEDescriptor,
        Details::BCEWithLogitsDescriptor,
        Details::CrossEntropyDescriptor,
        Details::MCCClassDescriptor,
        Details::MCCMulticlassDescriptor,
        Details::F1ClassDescriptor,
        Details::F1MulticlassDescriptor,
        Details::SIDDescriptor,
        Details::WassersteinDescriptor>;


    [[nodiscard]] constexpr auto MSE(const Details::MSEOptions& options = {}) noexcept -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto BoundedMSE(const Details::BoundedMSEOptions& options = {}) noexcept -> Details::BoundedMSEDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto BCEWithLogits(const Details::BCEWithLogitsOptions& options = {}) -> Details::BCEWithLogitsDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto CrossEntropy(const Details::CrossEntropyOptions& options = {}) noexcept -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MCCClass(const Details::MCCClassOptions& options = {}) noexcept -> Details::MCCClassDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MCCMulticlass(const Details::MCCMulticlassOptions& options = {}) noexcept -> Details::MCCMulticlassDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto F1Class(const Details::F1ClassOptions& options = {}) noexcept -> Details::F1ClassDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto F1Multiclass(const Details::F1MulticlassOptions& options = {}) noexcept -> Details::F1MulticlassDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto SID(const Details::SIDOptions& options = {}) noexcept -> Details::SIDDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Wasserstein(const Details::WassersteinOptions& options = {}) noexcept -> Details::WassersteinDescriptor {
        return {options};
    }
}

#endif //MOLPROP_LOSS_HPP
