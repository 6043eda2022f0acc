#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace image_denoiser::config {

namespace fs = std::filesystem;

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 8000;
  int io_threads = 1;
  int workers = 4;                // processing thread pool size
  int max_pending = 64;           // running + queued requests; never below workers
  int request_timeout_ms = 30000; // per-request processing and socket budget
  long long max_upload_bytes = 20LL * 1024 * 1024;
  std::vector<std::string> cors_allowed_origins{"http://localhost:3000",
                                                "http://127.0.0.1:3000"};
};

struct LimitsConfig {
  long long max_pixels = 40000000; // decoded width * height
};

struct WaveletConfig {
  int levels = 2;
  float max_threshold = 0.1f;     // threshold at strength 1, in [0,1] sample units
  std::string mode = "soft";      // soft | hard
};

struct FiltersConfig {
  int max_radius = 5;             // kernel 2r+1 at strength 1
  WaveletConfig wavelet;
};

struct ModelConfig {
  std::string path = "models/cdae.yml";
  std::string format = "auto";    // auto | native | onnx
  bool preload = true;            // load at startup instead of on first request
  int tile_overlap = 8;
  // Only read for ONNX models; native weight files declare their own shape.
  int onnx_tile_size = 64;
  int onnx_channels = 1;
};

struct OutputConfig {
  std::string format = "png";     // png | jpeg | bmp | tiff
  int png_compression = 3;
  int jpeg_quality = 95;
};

struct Config {
  ServerConfig server;
  LimitsConfig limits;
  FiltersConfig filters;
  ModelConfig model;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace image_denoiser::config
