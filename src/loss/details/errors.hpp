#ifndef MOLPROP_LOSS_ERRORS_HPP
#define MOLPROP_LOSS_ERRORS_HPP

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Molprop::Loss::Details {

    class UnsupportedDatasetType : public std::invalid_argument {
    public:
        explicit UnsupportedDatasetType(const std::string& dataset_type)
            : std::invalid_argument("Dataset type \"" + dataset_type + "\" not supported."),
              dataset_type_(dataset_type)
        {}

        [[nodiscard]] const std::string& dataset_type() const noexcept { return dataset_type_; }

    private:
        std::string dataset_type_;
    };

    class UnsupportedLossFunction : public std::invalid_argument {
    public:
        UnsupportedLossFunction(const std::string& loss_function,
                                const std::string& dataset_type,
                                std::vector<std::string> available)
            : std::invalid_argument(format(loss_function, dataset_type, available)),
              available_(std::move(available))
        {}

        [[nodiscard]] const std::vector<std::string>& available() const noexcept { return available_; }

    private:
        static std::string format(const std::string& loss_function,
                                  const std::string& dataset_type,
                                  const std::vector<std::string>& available) {
            std::ostringstream message;
            message << "Loss function \"" << loss_function << "\" not supported with dataset type "
                    << dataset_type << ". Available options for that dataset type are [";
            for (std::size_t i = 0; i < available.size(); ++i) {
                if (i > 0) {
                    message << ", ";
                }
                message << available[i];
            }
            message << "].";
            return message.str();
        }

        std::vector<std::string> available_;
    };

    class NoDefaultConfigured : public std::invalid_argument {
    public:
        explicit NoDefaultConfigured(const std::string& dataset_type)
            : std::invalid_argument("Default loss function not configured for dataset type " + dataset_type + ".")
        {}
    };

}

#endif // MOLPROP_LOSS_ERRORS_HPP
