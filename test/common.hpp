#ifndef MOLPROP_TEST_COMMON_HPP
#define MOLPROP_TEST_COMMON_HPP

#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <torch/torch.h>

#include "../include/Molprop.h"

namespace Molprop::Test {
    namespace Terminal = Utils::Terminal;

    class Runner {
    public:
        explicit Runner(std::string suite) : suite_(std::move(suite)) {}

        template <class Fn>
        void run(const std::string& name, Fn&& fn) {
            try {
                fn();
                ++passed_;
                std::cout << Terminal::ApplyColor(Terminal::Symbols::kCheck, Terminal::Colors::kGreen)
                          << ' ' << suite_ << '.' << name << '\n';
            } catch (const std::exception& error) {
                ++failed_;
                std::cerr << Terminal::ApplyColor(Terminal::Symbols::kCross, Terminal::Colors::kCrimson)
                          << ' ' << suite_ << '.' << name << ": " << error.what() << '\n';
            }
        }

        [[nodiscard]] int finish() const {
            const auto color = failed_ == 0 ? Terminal::Colors::kBrightGreen : Terminal::Colors::kCrimson;
            std::ostringstream summary;
            summary << suite_ << ": " << passed_ << " passed, " << failed_ << " failed";
            std::cout << Terminal::ApplyColor(summary.str(), color) << std::endl;
            return failed_ == 0 ? 0 : 1;
        }

    private:
        std::string suite_;
        int passed_{0};
        int failed_{0};
    };

    inline void expect(bool condition, std::string_view message) {
        if (!condition) {
            throw std::runtime_error(std::string(message));
        }
    }

    inline void expect_close(const torch::Tensor& actual, const torch::Tensor& expected, std::string_view what,
                             double atol = 1e-6, double rtol = 1e-5) {
        if (actual.sizes() != expected.sizes()) {
            std::ostringstream message;
            message << what << ": shape " << actual.sizes() << " != " << expected.sizes();
            throw std::runtime_error(message.str());
        }
        if (!torch::allclose(actual, expected.to(actual.options()), rtol, atol)) {
            std::ostringstream message;
            message << what << ": got\n" << actual << "\nexpected\n" << expected;
            throw std::runtime_error(message.str());
        }
    }

    inline void expect_near(double actual, double expected, std::string_view what, double tolerance = 1e-6) {
        if (!(std::abs(actual - expected) <= tolerance)) {
            std::ostringstream message;
            message << what << ": got " << actual << ", expected " << expected;
            throw std::runtime_error(message.str());
        }
    }

    template <class Exception, class Fn>
    Exception expect_throws(Fn&& fn, std::string_view what) {
        try {
            fn();
        } catch (const Exception& error) {
            return error;
        }
        throw std::runtime_error(std::string(what) + ": expected an exception");
    }

    inline torch::TensorOptions f64() {
        return torch::TensorOptions().dtype(torch::kFloat64);
    }
}

#endif // MOLPROP_TEST_COMMON_HPP
