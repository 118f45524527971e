#ifndef MOLPROP_LOSS_REGISTRY_HPP
#define MOLPROP_LOSS_REGISTRY_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "loss.hpp"

namespace Molprop::Loss {
    enum class DatasetType { Regression, Classification, Multiclass, Spectra };

    inline constexpr std::array<DatasetType, 4> kDatasetTypes{
        DatasetType::Regression,
        DatasetType::Classification,
        DatasetType::Multiclass,
        DatasetType::Spectra,
    };

    struct SelectOptions {
        // Copied into spectral losses as their value floor (the run's spectra target floor).
        std::optional<double> spectra_threshold{};
    };

    [[nodiscard]] constexpr std::string_view to_string(DatasetType type) noexcept {
        switch (type) {
            case DatasetType::Regression: return "regression";
            case DatasetType::Classification: return "classification";
            case DatasetType::Multiclass: return "multiclass";
            case DatasetType::Spectra:
            default: return "spectra";
        }
    }

    namespace Details {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        struct RegistryEntry {
            std::string name{};
            Descriptor descriptor{};
        };

        struct DatasetRegistry {
            DatasetType type{};
            std::vector<RegistryEntry> entries{};
            std::optional<std::string> default_name{};
        };

        // Both naming schemes stay registered: "spectra" and "cross_entropy" (classification) are
        // the legacy names of sid and binary_cross_entropy.
        inline const std::vector<DatasetRegistry>& registry()
        {
            static const std::vector<DatasetRegistry> table{
                DatasetRegistry{
                    DatasetType::Regression,
                    {
                        {"mse", MSE()},
                        {"bounded_mse", BoundedMSE()},
                    },
                    "mse"},
                DatasetRegistry{
                    DatasetType::Classification,
                    {
                        {"binary_cross_entropy", BCEWithLogits()},
                        {"cross_entropy", BCEWithLogits()},
                        {"mcc", MCCClass()},
                        {"f1", F1Class()},
                    },
                    "binary_cross_entropy"},
                DatasetRegistry{
                    DatasetType::Multiclass,
                    {
                        {"cross_entropy", CrossEntropy()},
                        {"mcc", MCCMulticlass()},
                        {"f1", F1Multiclass()},
                    },
                    "cross_entropy"},
                DatasetRegistry{
                    DatasetType::Spectra,
                    {
                        {"sid", SID()},
                        {"spectra", SID()},
                        {"wasserstein", Wasserstein()},
                    },
                    "sid"},
            };
            return table;
        }

        inline const DatasetRegistry& registry_for(DatasetType type)
        {
            const auto& table = registry();
            const auto it = std::find_if(table.begin(), table.end(), [type](const DatasetRegistry& candidate) {
                return candidate.type == type;
            });
            // Every DatasetType has a row; this only fires if the table and the enum drift apart.
            if (it == table.end()) {
                throw UnsupportedDatasetType(std::string{to_string(type)});
            }
            return *it;
        }

        inline const RegistryEntry* find_entry(const DatasetRegistry& dataset, const std::string& name)
        {
            const auto it = std::find_if(dataset.entries.begin(), dataset.entries.end(), [&name](const RegistryEntry& entry) {
                return entry.name == name;
            });
            return it == dataset.entries.end() ? nullptr : &*it;
        }

        inline Descriptor with_options(Descriptor descriptor, const SelectOptions& options)
        {
            std::visit(
                [&](auto& concrete) {
                    using DescriptorType = std::decay_t<decltype(concrete)>;
                    if constexpr (std::is_same_v<DescriptorType, SIDDescriptor>
                                  || std::is_same_v<DescriptorType, WassersteinDescriptor>) {
                        if (options.spectra_threshold.has_value()) {
                            concrete.options.threshold = options.spectra_threshold;
                        }
                    }
                },
                descriptor);
            return descriptor;
        }
    }

    [[nodiscard]] inline DatasetType parse_dataset_type(const std::string& value)
    {
        const auto lowered = Details::to_lower(value);
        for (const auto type : kDatasetTypes) {
            if (lowered == to_string(type)) {
                return type;
            }
        }
        throw UnsupportedDatasetType(value);
    }

    // Registered loss names for a dataset type, in registration order.
    [[nodiscard]] inline std::vector<std::string> available(DatasetType type)
    {
        const auto& dataset = Details::registry_for(type);
        std::vector<std::string> names;
        names.reserve(dataset.entries.size());
        for (const auto& entry : dataset.entries) {
            names.push_back(entry.name);
        }
        return names;
    }

    [[nodiscard]] inline std::optional<std::string> default_loss(DatasetType type)
    {
        return Details::registry_for(type).default_name;
    }

    /*
     * Resolves the loss for a dataset type. Without a name the dataset type's default is returned.
     * Throws UnsupportedLossFunction (listing the registered names) for an unknown name and
     * NoDefaultConfigured when no name is given and the dataset type has no default.
     */
    [[nodiscard]] inline Descriptor select(DatasetType type,
                                           const std::optional<std::string>& loss_function = std::nullopt,
                                           const SelectOptions& options = {})
    {
        const auto& dataset = Details::registry_for(type);
        const std::string dataset_name{to_string(type)};

        if (!loss_function.has_value()) {
            if (!dataset.default_name.has_value()) {
                throw NoDefaultConfigured(dataset_name);
            }
            const auto* entry = Details::find_entry(dataset, *dataset.default_name);
            if (entry == nullptr) {
                throw NoDefaultConfigured(dataset_name);
            }
            return Details::with_options(entry->descriptor, options);
        }

        const auto* entry = Details::find_entry(dataset, Details::to_lower(*loss_function));
        if (entry == nullptr) {
            throw UnsupportedLossFunction(*loss_function, dataset_name, available(type));
        }
        return Details::with_options(entry->descriptor, options);
    }

    [[nodiscard]] inline Descriptor select(const std::string& dataset_type,
                                           const std::optional<std::string>& loss_function = std::nullopt,
                                           const SelectOptions& options = {})
    {
        return select(parse_dataset_type(dataset_type), loss_function, options);
    }

    // Canonical type tag of a descriptor, as written by the configuration layer.
    [[nodiscard]] inline std::string name(const Descriptor& descriptor)
    {
        return std::visit(
            [](const auto& concrete) -> std::string {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<DescriptorType, Details::MSEDescriptor>) {
                    return "mse";
                } else if constexpr (std::is_same_v<DescriptorType, Details::BoundedMSEDescriptor>) {
                    return "bounded_mse";
                } else if constexpr (std::is_same_v<DescriptorType, Details::BCEWithLogitsDescriptor>) {
                    return "binary_cross_entropy";
                } else if constexpr (std::is_same_v<DescriptorType, Details::CrossEntropyDescriptor>) {
                    return "cross_entropy";
                } else if constexpr (std::is_same_v<DescriptorType, Details::MCCClassDescriptor>) {
                    return "mcc_class";
                } else if constexpr (std::is_same_v<DescriptorType, Details::MCCMulticlassDescriptor>) {
                    return "mcc_multiclass";
                } else if constexpr (std::is_same_v<DescriptorType, Details::F1ClassDescriptor>) {
                    return "f1_class";
                } else if constexpr (std::is_same_v<DescriptorType, Details::F1MulticlassDescriptor>) {
                    return "f1_multiclass";
                } else if constexpr (std::is_same_v<DescriptorType, Details::SIDDescriptor>) {
                    return "sid";
                } else if constexpr (std::is_same_v<DescriptorType, Details::WassersteinDescriptor>) {
                    return "wasserstein";
                } else {
                    static_assert(sizeof(DescriptorType) == 0, "Unsupported loss descriptor supplied.");
                }
            },
            descriptor);
    }

    // One-line summary such as "sid(threshold=1e-08)", for setup logs.
    [[nodiscard]] inline std::string describe(const Descriptor& descriptor)
    {
        std::ostringstream stream;
        stream << name(descriptor);
        std::visit(
            [&](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                const auto& options = concrete.options;
                if constexpr (std::is_same_v<DescriptorType, Details::BCEWithLogitsDescriptor>) {
                    if (!options.pos_weight.empty()) {
                        stream << "(pos_weight=[";
                        for (std::size_t i = 0; i < options.pos_weight.size(); ++i) {
                            stream << (i > 0 ? ", " : "") << options.pos_weight[i];
                        }
                        stream << "])";
                    }
                } else if constexpr (std::is_same_v<DescriptorType, Details::CrossEntropyDescriptor>) {
                    if (options.label_smoothing != 0.0) {
                        stream << "(label_smoothing=" << options.label_smoothing << ')';
                    }
                } else if constexpr (std::is_same_v<DescriptorType, Details::SIDDescriptor>
                                     || std::is_same_v<DescriptorType, Details::WassersteinDescriptor>) {
                    if (options.threshold.has_value()) {
                        stream << "(threshold=" << *options.threshold << ')';
                    }
                }
            },
            descriptor);
        return stream.str();
    }

    // Per-element loss of one batch. Reduction is left to the caller.
    [[nodiscard]] inline torch::Tensor compute(const Descriptor& descriptor,
                                               const torch::Tensor& prediction,
                                               const torch::Tensor& target,
                                               const Auxiliary& auxiliary = {})
    {
        return std::visit(
            [&](const auto& concrete) {
                return Details::compute(concrete, prediction, target, auxiliary);
            },
            descriptor);
    }
}

#endif // MOLPROP_LOSS_REGISTRY_HPP
