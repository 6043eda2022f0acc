#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace image_denoiser {

namespace fs = std::filesystem;

using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Channel-planar pixel buffer, samples normalized to [0,1].
// Geometry is fixed at construction; plane contents may be written.
class ImageBuffer {
public:
    ImageBuffer() = default;
    ImageBuffer(int height, int width, int channels, int bit_depth = 8);

    int height() const { return height_; }
    int width() const { return width_; }
    int channels() const { return static_cast<int>(planes_.size()); }
    int bit_depth() const { return bit_depth_; }
    bool empty() const { return planes_.empty() || height_ == 0 || width_ == 0; }

    Eigen::Ref<Matrix2Df> plane(int c) { return planes_.at(static_cast<size_t>(c)); }
    const Matrix2Df& plane(int c) const { return planes_.at(static_cast<size_t>(c)); }

    bool same_geometry(const ImageBuffer& other) const {
        return height_ == other.height_ && width_ == other.width_ &&
               channels() == other.channels();
    }

    // Clamp every sample into [0,1].
    void clamp_unit();

private:
    int height_ = 0;
    int width_ = 0;
    int bit_depth_ = 8;
    std::vector<Matrix2Df> planes_;
};

enum class DenoiseMethod {
    CDAE,
    MEAN,
    MEDIAN,
    WAVELET
};

inline std::string method_to_string(DenoiseMethod method) {
    switch (method) {
        case DenoiseMethod::CDAE: return "cdae";
        case DenoiseMethod::MEAN: return "mean";
        case DenoiseMethod::MEDIAN: return "median";
        case DenoiseMethod::WAVELET: return "wavelet";
        default: return "unknown";
    }
}

inline std::optional<DenoiseMethod> string_to_method(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "cdae") return DenoiseMethod::CDAE;
    if (norm == "mean") return DenoiseMethod::MEAN;
    if (norm == "median") return DenoiseMethod::MEDIAN;
    if (norm == "wavelet") return DenoiseMethod::WAVELET;
    return std::nullopt;
}

inline const std::vector<DenoiseMethod>& all_methods() {
    static const std::vector<DenoiseMethod> methods = {
        DenoiseMethod::CDAE, DenoiseMethod::MEAN, DenoiseMethod::MEDIAN,
        DenoiseMethod::WAVELET};
    return methods;
}

// Encoded output formats
enum class ImageFormat {
    UNKNOWN,
    PNG,
    JPEG,
    BMP,
    TIFF
};

inline std::string image_format_to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG: return "png";
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::BMP: return "bmp";
        case ImageFormat::TIFF: return "tiff";
        default: return "unknown";
    }
}

inline ImageFormat string_to_image_format(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (norm == "png") return ImageFormat::PNG;
    if (norm == "jpeg" || norm == "jpg") return ImageFormat::JPEG;
    if (norm == "bmp") return ImageFormat::BMP;
    if (norm == "tiff" || norm == "tif") return ImageFormat::TIFF;
    return ImageFormat::UNKNOWN;
}

inline std::string image_format_content_type(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG: return "image/png";
        case ImageFormat::JPEG: return "image/jpeg";
        case ImageFormat::BMP: return "image/bmp";
        case ImageFormat::TIFF: return "image/tiff";
        default: return "application/octet-stream";
    }
}

} // namespace image_denoiser
