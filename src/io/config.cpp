#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/types.hpp"

#include <fstream>
#include <sstream>

namespace image_denoiser::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    Config cfg;
    try {
        YAML::Node node = YAML::LoadFile(path.string());
        cfg = from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }

    // Model paths are relative to the config file, not the working directory.
    fs::path model_path(cfg.model.path);
    if (!cfg.model.path.empty() && model_path.is_relative()) {
        cfg.model.path = (path.parent_path() / model_path).lexically_normal().string();
    }
    return cfg;
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["server"]) {
        auto s = node["server"];
        if (s["host"]) cfg.server.host = s["host"].as<std::string>();
        if (s["port"]) cfg.server.port = s["port"].as<int>();
        if (s["io_threads"]) cfg.server.io_threads = s["io_threads"].as<int>();
        if (s["workers"]) cfg.server.workers = s["workers"].as<int>();
        if (s["max_pending"]) cfg.server.max_pending = s["max_pending"].as<int>();
        if (s["request_timeout_ms"]) cfg.server.request_timeout_ms = s["request_timeout_ms"].as<int>();
        if (s["max_upload_bytes"]) cfg.server.max_upload_bytes = s["max_upload_bytes"].as<long long>();
        read_string_list(s["cors_allowed_origins"], cfg.server.cors_allowed_origins);
    }

    if (node["limits"]) {
        auto l = node["limits"];
        if (l["max_pixels"]) cfg.limits.max_pixels = l["max_pixels"].as<long long>();
    }

    if (node["filters"]) {
        auto f = node["filters"];
        if (f["max_radius"]) cfg.filters.max_radius = f["max_radius"].as<int>();
        if (f["wavelet"]) {
            auto w = f["wavelet"];
            if (w["levels"]) cfg.filters.wavelet.levels = w["levels"].as<int>();
            if (w["max_threshold"]) cfg.filters.wavelet.max_threshold = w["max_threshold"].as<float>();
            if (w["mode"]) cfg.filters.wavelet.mode = w["mode"].as<std::string>();
        }
    }

    if (node["model"]) {
        auto m = node["model"];
        if (m["path"]) cfg.model.path = m["path"].as<std::string>();
        if (m["format"]) cfg.model.format = m["format"].as<std::string>();
        if (m["preload"]) cfg.model.preload = m["preload"].as<bool>();
        if (m["tile_overlap"]) cfg.model.tile_overlap = m["tile_overlap"].as<int>();
        if (m["onnx_tile_size"]) cfg.model.onnx_tile_size = m["onnx_tile_size"].as<int>();
        if (m["onnx_channels"]) cfg.model.onnx_channels = m["onnx_channels"].as<int>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["format"]) cfg.output.format = o["format"].as<std::string>();
        if (o["png_compression"]) cfg.output.png_compression = o["png_compression"].as<int>();
        if (o["jpeg_quality"]) cfg.output.jpeg_quality = o["jpeg_quality"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["server"]["host"] = server.host;
    node["server"]["port"] = server.port;
    node["server"]["io_threads"] = server.io_threads;
    node["server"]["workers"] = server.workers;
    node["server"]["max_pending"] = server.max_pending;
    node["server"]["request_timeout_ms"] = server.request_timeout_ms;
    node["server"]["max_upload_bytes"] = server.max_upload_bytes;
    node["server"]["cors_allowed_origins"] = server.cors_allowed_origins;

    node["limits"]["max_pixels"] = limits.max_pixels;

    node["filters"]["max_radius"] = filters.max_radius;
    node["filters"]["wavelet"]["levels"] = filters.wavelet.levels;
    node["filters"]["wavelet"]["max_threshold"] = filters.wavelet.max_threshold;
    node["filters"]["wavelet"]["mode"] = filters.wavelet.mode;

    node["model"]["path"] = model.path;
    node["model"]["format"] = model.format;
    node["model"]["preload"] = model.preload;
    node["model"]["tile_overlap"] = model.tile_overlap;
    node["model"]["onnx_tile_size"] = model.onnx_tile_size;
    node["model"]["onnx_channels"] = model.onnx_channels;

    node["output"]["format"] = output.format;
    node["output"]["png_compression"] = output.png_compression;
    node["output"]["jpeg_quality"] = output.jpeg_quality;

    return node;
}

void Config::validate() const {
    if (server.host.empty()) {
        throw ValidationError("server.host must not be empty");
    }
    if (server.port < 0 || server.port > 65535) {
        throw ValidationError("server.port must be in [0,65535]");
    }
    if (server.io_threads < 1 || server.io_threads > 64) {
        throw ValidationError("server.io_threads must be in [1,64]");
    }
    if (server.workers < 1 || server.workers > 256) {
        throw ValidationError("server.workers must be in [1,256]");
    }
    if (server.max_pending < 1) {
        throw ValidationError("server.max_pending must be >= 1");
    }
    if (server.request_timeout_ms < 1) {
        throw ValidationError("server.request_timeout_ms must be >= 1");
    }
    if (server.max_upload_bytes < 1) {
        throw ValidationError("server.max_upload_bytes must be >= 1");
    }

    if (limits.max_pixels < 1) {
        throw ValidationError("limits.max_pixels must be >= 1");
    }

    if (filters.max_radius < 1 || filters.max_radius > 50) {
        throw ValidationError("filters.max_radius must be in [1,50]");
    }
    if (filters.wavelet.levels < 1 || filters.wavelet.levels > 8) {
        throw ValidationError("filters.wavelet.levels must be in [1,8]");
    }
    if (!(filters.wavelet.max_threshold > 0.0f) || filters.wavelet.max_threshold > 1.0f) {
        throw ValidationError("filters.wavelet.max_threshold must be in (0,1]");
    }
    if (filters.wavelet.mode != "soft" && filters.wavelet.mode != "hard") {
        throw ValidationError("filters.wavelet.mode must be 'soft' or 'hard'");
    }

    if (model.format != "auto" && model.format != "native" && model.format != "onnx") {
        throw ValidationError("model.format must be 'auto', 'native' or 'onnx'");
    }
    if (model.tile_overlap < 0) {
        throw ValidationError("model.tile_overlap must be >= 0");
    }
    if (model.onnx_tile_size < 8) {
        throw ValidationError("model.onnx_tile_size must be >= 8");
    }
    if (2 * model.tile_overlap >= model.onnx_tile_size) {
        throw ValidationError("model.tile_overlap must be less than half of model.onnx_tile_size");
    }
    if (model.onnx_channels != 1 && model.onnx_channels != 3) {
        throw ValidationError("model.onnx_channels must be 1 or 3");
    }

    if (string_to_image_format(output.format) == ImageFormat::UNKNOWN) {
        throw ValidationError("output.format must be 'png', 'jpeg', 'bmp' or 'tiff'");
    }
    if (output.png_compression < 0 || output.png_compression > 9) {
        throw ValidationError("output.png_compression must be in [0,9]");
    }
    if (output.jpeg_quality < 1 || output.jpeg_quality > 100) {
        throw ValidationError("output.jpeg_quality must be in [1,100]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "server": {
      "type": "object",
      "properties": {
        "host": {"type": "string"},
        "port": {"type": "integer", "minimum": 0, "maximum": 65535},
        "io_threads": {"type": "integer", "minimum": 1, "maximum": 64},
        "workers": {"type": "integer", "minimum": 1, "maximum": 256},
        "max_pending": {"type": "integer", "minimum": 1},
        "request_timeout_ms": {"type": "integer", "minimum": 1},
        "max_upload_bytes": {"type": "integer", "minimum": 1},
        "cors_allowed_origins": {"type": "array", "items": {"type": "string"}}
      }
    },
    "limits": {
      "type": "object",
      "properties": {
        "max_pixels": {"type": "integer", "minimum": 1}
      }
    },
    "filters": {
      "type": "object",
      "properties": {
        "max_radius": {"type": "integer", "minimum": 1, "maximum": 50},
        "wavelet": {
          "type": "object",
          "properties": {
            "levels": {"type": "integer", "minimum": 1, "maximum": 8},
            "max_threshold": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
            "mode": {"type": "string", "enum": ["soft", "hard"]}
          }
        }
      }
    },
    "model": {
      "type": "object",
      "properties": {
        "path": {"type": "string"},
        "format": {"type": "string", "enum": ["auto", "native", "onnx"]},
        "preload": {"type": "boolean"},
        "tile_overlap": {"type": "integer", "minimum": 0},
        "onnx_tile_size": {"type": "integer", "minimum": 8},
        "onnx_channels": {"type": "integer", "enum": [1, 3]}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "format": {"type": "string", "enum": ["png", "jpeg", "bmp", "tiff"]},
        "png_compression": {"type": "integer", "minimum": 0, "maximum": 9},
        "jpeg_quality": {"type": "integer", "minimum": 1, "maximum": 100}
      }
    }
  }
})";
}

} // namespace image_denoiser::config
