#include "image_denoiser/pipeline/dispatcher.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/utils.hpp"

#include <opencv2/core.hpp>

#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace image_denoiser::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

double ms_since(Clock::time_point t0) {
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

void check_strength(float strength) {
    if (!std::isfinite(strength) || strength < 0.0f || strength > 1.0f) {
        std::ostringstream oss;
        oss << "strength must be within [0,1], got " << strength;
        throw InvalidStrengthError(oss.str());
    }
}

// Typed errors pass through; anything else thrown inside a stage is
// reported as a ProcessError for that stage.
template <typename Fn>
auto run_stage(ProcessStage stage, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const DenoiserError&) {
        throw;
    } catch (const cv::Exception& e) {
        throw ProcessError(stage, e.msg);
    } catch (const std::exception& e) {
        throw ProcessError(stage, e.what());
    }
}

} // namespace

float parse_strength(const std::string& text) {
    std::string t = core::trim(text);
    if (t.empty()) t = kDefaultStrength;

    const char* begin = t.c_str();
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(begin, &end);
    if (end == begin || end != begin + t.size()) {
        throw InvalidStrengthError("'" + t + "' is not a number");
    }
    // Underflow rounds to zero and stays valid; only overflow is an error.
    if (errno == ERANGE && std::fabs(parsed) > 1.0) {
        throw InvalidStrengthError("'" + t + "' is out of range");
    }
    if (!std::isfinite(parsed)) {
        throw InvalidStrengthError("'" + t + "' is not a finite number");
    }
    if (parsed < 0.0 || parsed > 1.0) {
        throw InvalidStrengthError("strength must be within [0,1], got " + t);
    }
    const float value = static_cast<float>(parsed);
    check_strength(value);
    return value;
}

DenoiseMethod parse_method(const std::string& text) {
    const std::string t = core::trim(text);
    if (t.empty()) return DenoiseMethod::CDAE;
    auto method = string_to_method(t);
    if (!method) {
        throw InvalidMethodError(t);
    }
    return *method;
}

DenoiseRequest DenoiseRequest::from_fields(std::vector<uint8_t> image, const std::string& method,
                                           const std::string& strength) {
    DenoiseRequest req;
    req.method = parse_method(method);
    req.strength = parse_strength(strength);
    req.image = std::move(image);
    return req;
}

Dispatcher::Dispatcher(const config::Config& cfg, cdae::ModelHandle& model)
    : filter_params_(filters::FilterParams::from_config(cfg.filters)),
      max_pixels_(cfg.limits.max_pixels),
      tile_overlap_(cfg.model.tile_overlap),
      model_(model) {
    encode_.format = string_to_image_format(cfg.output.format);
    encode_.png_compression = cfg.output.png_compression;
    encode_.jpeg_quality = cfg.output.jpeg_quality;
    if (encode_.format == ImageFormat::UNKNOWN) {
        throw ConfigError("output.format '" + cfg.output.format + "' is not supported");
    }
}

ImageBuffer Dispatcher::denoise(const ImageBuffer& image, DenoiseMethod method, float strength,
                                const core::Deadline& deadline) const {
    check_strength(strength);
    switch (method) {
        case DenoiseMethod::MEAN:
            return filters::apply_filter(image, filters::FilterKind::MEAN, strength, filter_params_,
                                         deadline);
        case DenoiseMethod::MEDIAN:
            return filters::apply_filter(image, filters::FilterKind::MEDIAN, strength,
                                         filter_params_, deadline);
        case DenoiseMethod::WAVELET:
            return filters::apply_filter(image, filters::FilterKind::WAVELET, strength,
                                         filter_params_, deadline);
        case DenoiseMethod::CDAE:
            return cdae::infer(model_.acquire(), image, strength, tile_overlap_, deadline);
        default:
            throw InvalidMethodError(method_to_string(method));
    }
}

DenoiseResult Dispatcher::process(const DenoiseRequest& request,
                                  const core::Deadline& deadline) const {
    check_strength(request.strength);

    DenoiseResult result;
    result.method = request.method;
    result.strength = request.strength;

    deadline.check("decode");
    auto t0 = Clock::now();
    const ImageBuffer image = run_stage(ProcessStage::DECODE, [&]() {
        return io::decode_image(request.image, max_pixels_);
    });
    result.decode_ms = ms_since(t0);

    const ProcessStage method_stage =
        request.method == DenoiseMethod::CDAE ? ProcessStage::INFERENCE : ProcessStage::FILTER;
    deadline.check(process_stage_to_string(method_stage));
    t0 = Clock::now();
    const ImageBuffer denoised = run_stage(method_stage, [&]() {
        return denoise(image, request.method, request.strength, deadline);
    });
    if (!denoised.same_geometry(image)) {
        throw ProcessError(method_stage, "output geometry differs from input");
    }
    result.denoise_ms = ms_since(t0);

    deadline.check("encode");
    t0 = Clock::now();
    result.data = run_stage(ProcessStage::ENCODE, [&]() {
        return io::encode_image(denoised, encode_);
    });
    result.encode_ms = ms_since(t0);

    result.content_type = image_format_content_type(encode_.format);
    result.width = image.width();
    result.height = image.height();
    result.channels = image.channels();
    return result;
}

} // namespace image_denoiser::pipeline
