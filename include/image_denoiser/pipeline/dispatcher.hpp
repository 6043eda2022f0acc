#pragma once

#include "image_denoiser/cdae/runtime.hpp"
#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/deadline.hpp"
#include "image_denoiser/core/types.hpp"
#include "image_denoiser/filters/classical.hpp"
#include "image_denoiser/io/image_codec.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace image_denoiser::pipeline {

constexpr const char* kDefaultStrength = "0.5";

// Parse a strength field. Empty text yields the default 0.5. Throws
// InvalidStrengthError for anything that is not a finite number in [0,1].
float parse_strength(const std::string& text);

// Parse a method field. Empty text yields cdae. Throws InvalidMethodError.
DenoiseMethod parse_method(const std::string& text);

struct DenoiseRequest {
    std::vector<uint8_t> image;
    DenoiseMethod method = DenoiseMethod::CDAE;
    float strength = 0.5f;

    // Validates method and strength text before the image is looked at.
    static DenoiseRequest from_fields(std::vector<uint8_t> image, const std::string& method,
                                      const std::string& strength);
};

struct DenoiseResult {
    std::vector<uint8_t> data;
    std::string content_type;
    int width = 0;
    int height = 0;
    int channels = 0;
    DenoiseMethod method = DenoiseMethod::CDAE;
    float strength = 0.0f;
    double decode_ms = 0.0;
    double denoise_ms = 0.0;
    double encode_ms = 0.0;
};

// Runs decode -> method -> encode for one request. Holds no per-request
// state; one instance serves all worker threads.
class Dispatcher {
public:
    Dispatcher(const config::Config& cfg, cdae::ModelHandle& model);

    // Throws InvalidStrengthError, DecodeError, UploadTooLargeError,
    // ModelUnavailableError, TimeoutError or ProcessError{stage}.
    DenoiseResult process(const DenoiseRequest& request,
                          const core::Deadline& deadline = core::Deadline::none()) const;

    // The method step alone, on an already decoded buffer.
    ImageBuffer denoise(const ImageBuffer& image, DenoiseMethod method, float strength,
                        const core::Deadline& deadline = core::Deadline::none()) const;

    const io::EncodeOptions& encode_options() const { return encode_; }

private:
    filters::FilterParams filter_params_;
    io::EncodeOptions encode_;
    long long max_pixels_;
    int tile_overlap_;
    cdae::ModelHandle& model_;
};

} // namespace image_denoiser::pipeline
