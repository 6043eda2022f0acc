#include "image_denoiser/cdae/model.hpp"
#include "image_denoiser/cdae/runtime.hpp"
#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/events.hpp"
#include "image_denoiser/core/utils.hpp"
#include "image_denoiser/pipeline/dispatcher.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace image_denoiser;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static int report_error(const DenoiserError& e) {
    std::cerr << json{{"error", e.what()}, {"reason", error_reason_to_string(e.reason())}}.dump()
              << std::endl;
    return 1;
}

static config::Config load_or_default(const std::string& path) {
    return path.empty() ? config::Config() : config::Config::load(path);
}

// ============================================================================
// denoise --input <image> --output <image> [--method] [--strength] [--config]
// ============================================================================
int cmd_denoise(const std::string& input, const std::string& output, const std::string& method,
                const std::string& strength, const std::string& config_path,
                const std::string& format) {
    core::EventEmitter events(std::cerr);
    try {
        config::Config cfg = load_or_default(config_path);
        if (!format.empty()) cfg.output.format = format;
        cfg.validate();

        const auto request = pipeline::DenoiseRequest::from_fields(core::read_bytes(input), method, strength);

        cdae::ModelHandle model(cfg.model, &events);
        pipeline::Dispatcher dispatcher(cfg, model);
        const pipeline::DenoiseResult result = dispatcher.process(request);
        core::write_bytes(output, result.data);

        print_json({
            {"input", input},
            {"output", output},
            {"method", method_to_string(result.method)},
            {"strength", result.strength},
            {"width", result.width},
            {"height", result.height},
            {"channels", result.channels},
            {"content_type", result.content_type},
            {"bytes", result.data.size()},
            {"decode_ms", result.decode_ms},
            {"denoise_ms", result.denoise_ms},
            {"encode_ms", result.encode_ms}
        });
        return 0;
    } catch (const DenoiserError& e) {
        return report_error(e);
    }
}

// ============================================================================
// validate-config --path <yaml>
// ============================================================================
int cmd_validate_config(const std::string& path) {
    json result;
    result["path"] = path;
    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
        result["errors"] = json::array();
    } catch (const DenoiserError& e) {
        result["valid"] = false;
        result["errors"] = json::array({e.what()});
    }
    print_json(result);
    return result["valid"].get<bool>() ? 0 : 1;
}

// ============================================================================
// show-config [--path <yaml>]
// ============================================================================
int cmd_show_config(const std::string& path) {
    try {
        const config::Config cfg = load_or_default(path);
        YAML::Emitter out;
        out << cfg.to_yaml();
        std::cout << out.c_str() << std::endl;
        return 0;
    } catch (const DenoiserError& e) {
        return report_error(e);
    }
}

// ============================================================================
// model-info --model <path> [--format] [--tile-size] [--channels]
// ============================================================================
int cmd_model_info(const std::string& path, const std::string& format, int tile_size, int channels) {
    config::ModelConfig mc;
    mc.path = path;
    mc.format = format;
    mc.onnx_tile_size = tile_size;
    mc.onnx_channels = channels;
    try {
        const auto model = cdae::load_model(mc);
        const cdae::ModelInfo mi = model->info();
        print_json({
            {"format", mi.format},
            {"path", mi.path},
            {"channels", mi.channels},
            {"tile_size", mi.tile_size},
            {"residual", mi.residual},
            {"layers", mi.layers},
            {"pools", mi.pools},
            {"parameters", mi.parameters}
        });
        return 0;
    } catch (const DenoiserError& e) {
        return report_error(e);
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"Image denoiser command line"};
    app.require_subcommand(1);

    std::string input, output, method, strength = pipeline::kDefaultStrength, config_path, format;
    auto* denoise_cmd = app.add_subcommand("denoise", "Denoise one image file");
    denoise_cmd->add_option("--input,-i", input, "Input image")->required();
    denoise_cmd->add_option("--output,-o", output, "Output image")->required();
    denoise_cmd->add_option("--method,-m", method, "cdae | mean | median | wavelet")->default_val("cdae");
    denoise_cmd->add_option("--strength,-s", strength, "Strength in [0,1]");
    denoise_cmd->add_option("--config,-c", config_path, "Config YAML");
    denoise_cmd->add_option("--format", format, "Output format: png | jpeg | bmp | tiff");

    std::string validate_path;
    auto* validate_cmd = app.add_subcommand("validate-config", "Load and validate a config file");
    validate_cmd->add_option("--path", validate_path, "Config YAML")->required();

    std::string show_path;
    auto* show_cmd = app.add_subcommand("show-config", "Print the effective configuration");
    show_cmd->add_option("--path", show_path, "Config YAML (defaults when omitted)");

    auto* schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

    std::string model_path, model_format = "auto";
    int tile_size = config::ModelConfig().onnx_tile_size;
    int channels = config::ModelConfig().onnx_channels;
    auto* model_cmd = app.add_subcommand("model-info", "Load a CDAE weights file and describe it");
    model_cmd->add_option("--model", model_path, "Weights file")->required();
    model_cmd->add_option("--format", model_format, "auto | native | onnx");
    model_cmd->add_option("--tile-size", tile_size, "ONNX input tile size");
    model_cmd->add_option("--channels", channels, "ONNX input channels");

    CLI11_PARSE(app, argc, argv);

    if (denoise_cmd->parsed()) {
        return cmd_denoise(input, output, method, strength, config_path, format);
    }
    if (validate_cmd->parsed()) {
        return cmd_validate_config(validate_path);
    }
    if (show_cmd->parsed()) {
        return cmd_show_config(show_path);
    }
    if (schema_cmd->parsed()) {
        std::cout << config::get_schema_json() << std::endl;
        return 0;
    }
    if (model_cmd->parsed()) {
        return cmd_model_info(model_path, model_format, tile_size, channels);
    }

    std::cerr << app.help() << std::endl;
    return 1;
}
