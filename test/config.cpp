#include <cmath>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

#include <boost/property_tree/json_parser.hpp>

#include "common.hpp"

using namespace Molprop;
using Molprop::Test::expect;
namespace SaveLoad = Molprop::Common::SaveLoad;

namespace {
    SaveLoad::PropertyTree parse(const std::string& json) {
        std::istringstream stream(json);
        SaveLoad::PropertyTree tree;
        boost::property_tree::read_json(stream, tree);
        return tree;
    }
}

int main() {
    Test::Runner runner("config");

    runner.run("file_round_trip_selects_configured_loss", [] {
        const auto path = std::filesystem::temp_directory_path() / "molprop_loss_config_test.json";
        SaveLoad::LossConfig config;
        config.dataset_type = "spectra";
        config.loss_function = "wasserstein";
        config.spectra_target_floor = 1e-8;
        SaveLoad::write_json_file(path, SaveLoad::serialize_loss_config(config));

        const auto loaded = SaveLoad::read_loss_config(path);
        std::filesystem::remove(path);

        expect(loaded.dataset_type == "spectra", "dataset type");
        expect(loaded.loss_function == std::optional<std::string>{"wasserstein"}, "loss function");
        expect(loaded.spectra_target_floor.has_value() && std::abs(*loaded.spectra_target_floor - 1e-8) < 1e-20, "floor");

        const auto descriptor = SaveLoad::select_loss(loaded);
        expect(Loss::describe(descriptor) == "wasserstein(threshold=1e-08)", Loss::describe(descriptor));
    });

    runner.run("omitted_loss_function_selects_default", [] {
        const auto config = SaveLoad::parse_loss_config(parse(R"({"dataset_type": "multiclass"})"), "inline");
        expect(!config.loss_function.has_value(), "no loss function");
        expect(Loss::name(SaveLoad::select_loss(config)) == "cross_entropy", "multiclass default");

        const auto empty = SaveLoad::parse_loss_config(parse(R"({"dataset_type": "regression", "loss_function": ""})"), "inline");
        expect(!empty.loss_function.has_value(), "empty name means default");
        expect(Loss::name(SaveLoad::select_loss(empty)) == "mse", "regression default");
    });

    runner.run("legacy_names_still_resolve", [] {
        const auto config = SaveLoad::parse_loss_config(parse(R"({"dataset_type": "spectra", "loss_function": "spectra"})"), "legacy");
        expect(Loss::name(SaveLoad::select_loss(config)) == "sid", "legacy spectra name");
    });

    runner.run("missing_dataset_type_is_reported", [] {
        const auto error = Test::expect_throws<std::runtime_error>([] {
            (void)SaveLoad::parse_loss_config(parse(R"({"loss_function": "mse"})"), "run.json");
        }, "missing dataset_type");
        const std::string message = error.what();
        expect(message.find("dataset_type") != std::string::npos && message.find("run.json") != std::string::npos, message);
    });

    runner.run("mistyped_floor_is_reported", [] {
        Test::expect_throws<std::runtime_error>([] {
            (void)SaveLoad::parse_loss_config(parse(R"({"dataset_type": "spectra", "spectra_target_floor": "low"})"), "run.json");
        }, "non numeric floor");
    });

    runner.run("unsupported_configuration_surfaces_taxonomy", [] {
        const auto unknown_type = SaveLoad::parse_loss_config(parse(R"({"dataset_type": "graph"})"), "run.json");
        Test::expect_throws<Loss::UnsupportedDatasetType>([&] { (void)SaveLoad::select_loss(unknown_type); }, "graph");

        const auto unknown_loss = SaveLoad::parse_loss_config(parse(R"({"dataset_type": "regression", "loss_function": "huber"})"), "run.json");
        Test::expect_throws<Loss::UnsupportedLossFunction>([&] { (void)SaveLoad::select_loss(unknown_loss); }, "huber");
    });

    runner.run("descriptor_options_survive_serialization", [] {
        Loss::Details::BCEWithLogitsOptions bce_options;
        bce_options.pos_weight = {3.0, 0.5};
        const auto bce = SaveLoad::deserialize_loss(SaveLoad::serialize_loss(Loss::BCEWithLogits(bce_options)), "bce");
        expect(std::get<Loss::Details::BCEWithLogitsDescriptor>(bce).options.pos_weight == bce_options.pos_weight, "pos_weight");

        Loss::Details::SIDOptions sid_options;
        sid_options.threshold = 0.001;
        const auto sid = SaveLoad::deserialize_loss(SaveLoad::serialize_loss(Loss::SID(sid_options)), "sid");
        expect(std::get<Loss::Details::SIDDescriptor>(sid).options.threshold == 0.001, "threshold");

        const auto mcc = SaveLoad::deserialize_loss(SaveLoad::serialize_loss(Loss::select("multiclass", std::string{"mcc"})), "mcc");
        expect(Loss::name(mcc) == "mcc_multiclass", "multiclass MCC keeps its variant");
    });

    runner.run("unknown_descriptor_type_is_reported", [] {
        const auto error = Test::expect_throws<std::runtime_error>([] {
            (void)SaveLoad::deserialize_loss(parse(R"({"type": "focal"})"), "loss");
        }, "focal");
        expect(std::string(error.what()).find("focal") != std::string::npos, error.what());
    });

    runner.run("unreadable_file_is_reported", [] {
        Test::expect_throws<std::runtime_error>([] {
            (void)SaveLoad::read_loss_config(std::filesystem::temp_directory_path() / "molprop_missing_config.json");
        }, "missing file");
    });

    return runner.finish();
}
