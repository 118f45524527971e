#ifndef MOLPROP_COMMON_SAVE_LOAD_HPP
#define MOLPROP_COMMON_SAVE_LOAD_HPP
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../loss/loss.hpp"
#include "../loss/registry.hpp"

namespace Molprop::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    // Loss section of a run configuration.
    struct LossConfig {
        std::string dataset_type{};
        std::optional<std::string> loss_function{};
        std::optional<double> spectra_target_floor{};
    };

    namespace Detail {
        using Loss::Details::to_lower;

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        template <class Numeric>
        std::optional<Numeric> find_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            if (!tree.get_child_optional(key)) {
                return std::nullopt;
            }
            return get_numeric<Numeric>(tree, key, context);
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw std::runtime_error(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }
    }

    inline PropertyTree serialize_loss(const Loss::Descriptor& descriptor)
    {
        PropertyTree tree;
        tree.put("type", Loss::name(descriptor));
        std::visit(
            [&](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                const auto& options = concrete.options;
                if constexpr (std::is_same_v<DescriptorType, Loss::Details::BCEWithLogitsDescriptor>) {
                    tree.put_child("options.pos_weight", Detail::write_array(options.pos_weight));
                } else if constexpr (std::is_same_v<DescriptorType, Loss::Details::CrossEntropyDescriptor>) {
                    tree.put("options.label_smoothing", options.label_smoothing);
                } else if constexpr (std::is_same_v<DescriptorType, Loss::Details::SIDDescriptor>
                                     || std::is_same_v<DescriptorType, Loss::Details::WassersteinDescriptor>) {
                    if (options.threshold.has_value()) {
                        tree.put("options.threshold", *options.threshold);
                    }
                }
            },
            descriptor);
        return tree;
    }

    inline Loss::Descriptor deserialize_loss(const PropertyTree& tree, const std::string& context)
    {
        const auto type = Detail::to_lower(Detail::get_string(tree, "type", context));
        if (type == "mse") {
            return Loss::Descriptor{Loss::MSE()};
        }
        if (type == "bounded_mse") {
            return Loss::Descriptor{Loss::BoundedMSE()};
        }
        if (type == "binary_cross_entropy") {
            Loss::Details::BCEWithLogitsOptions options;
            if (const auto pos_weight_tree = tree.get_child_optional("options.pos_weight"))
                options.pos_weight = Detail::read_array<double>(*pos_weight_tree, context + ".options.pos_weight");
            return Loss::Descriptor{Loss::BCEWithLogits(options)};
        }
        if (type == "cross_entropy") {
            Loss::Details::CrossEntropyOptions options;
            if (const auto smoothing = Detail::find_numeric<double>(tree, "options.label_smoothing", context))
                options.label_smoothing = *smoothing;
            return Loss::Descriptor{Loss::CrossEntropy(options)};
        }
        if (type == "mcc_class") {
            return Loss::Descriptor{Loss::MCCClass()};
        }
        if (type == "mcc_multiclass") {
            return Loss::Descriptor{Loss::MCCMulticlass()};
        }
        if (type == "f1_class") {
            return Loss::Descriptor{Loss::F1Class()};
        }
        if (type == "f1_multiclass") {
            return Loss::Descriptor{Loss::F1Multiclass()};
        }
        if (type == "sid") {
            Loss::Details::SIDOptions options;
            options.threshold = Detail::find_numeric<double>(tree, "options.threshold", context);
            return Loss::Descriptor{Loss::SID(options)};
        }
        if (type == "wasserstein") {
            Loss::Details::WassersteinOptions options;
            options.threshold = Detail::find_numeric<double>(tree, "options.threshold", context);
            return Loss::Descriptor{Loss::Wasserstein(options)};
        }
        std::ostringstream message;
        message << "Unknown loss descriptor '" << type << "' in " << context;
        throw std::runtime_error(message.str());
    }

    /*
     * Reads the loss section of a run configuration:
     *   { "dataset_type": "spectra", "loss_function": "wasserstein", "spectra_target_floor": 1e-8 }
     * Only dataset_type is required.
     */
    inline LossConfig parse_loss_config(const PropertyTree& tree, const std::string& context)
    {
        LossConfig config;
        config.dataset_type = Detail::get_string(tree, "dataset_type", context);
        if (const auto loss_function = tree.get_optional<std::string>("loss_function")) {
            if (!loss_function->empty()) {
                config.loss_function = *loss_function;
            }
        }
        config.spectra_target_floor = Detail::find_numeric<double>(tree, "spectra_target_floor", context);
        return config;
    }

    inline PropertyTree serialize_loss_config(const LossConfig& config)
    {
        PropertyTree tree;
        tree.put("dataset_type", config.dataset_type);
        if (config.loss_function.has_value()) {
            tree.put("loss_function", *config.loss_function);
        }
        if (config.spectra_target_floor.has_value()) {
            tree.put("spectra_target_floor", *config.spectra_target_floor);
        }
        return tree;
    }

    inline Loss::Descriptor select_loss(const LossConfig& config)
    {
        Loss::SelectOptions options;
        options.spectra_threshold = config.spectra_target_floor;
        return Loss::select(config.dataset_type, config.loss_function, options);
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            std::ostringstream message;
            message << "Failed to read '" << path.string() << "': " << error.what();
            throw std::runtime_error(message.str());
        }
        return tree;
    }

    inline LossConfig read_loss_config(const std::filesystem::path& path)
    {
        return parse_loss_config(read_json_file(path), path.string());
    }
}
#endif // MOLPROP_COMMON_SAVE_LOAD_HPP
