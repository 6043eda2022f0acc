#include "image_denoiser/filters/classical.hpp"
#include "image_denoiser/filters/wavelet.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/utils.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace image_denoiser::filters {

std::string filter_kind_to_string(FilterKind kind) {
    switch (kind) {
        case FilterKind::MEAN: return "mean";
        case FilterKind::MEDIAN: return "median";
        case FilterKind::WAVELET: return "wavelet";
        default: return "unknown";
    }
}

FilterParams FilterParams::from_config(const config::FiltersConfig& cfg) {
    FilterParams p;
    p.max_radius = cfg.max_radius;
    p.wavelet_levels = cfg.wavelet.levels;
    p.wavelet_max_threshold = cfg.wavelet.max_threshold;
    p.wavelet_mode = (cfg.wavelet.mode == "hard") ? ThresholdMode::HARD : ThresholdMode::SOFT;
    return p;
}

int radius_for_strength(float strength, int max_radius) {
    const float s = std::clamp(strength, 0.0f, 1.0f);
    return static_cast<int>(std::lround(s * static_cast<float>(std::max(0, max_radius))));
}

float wavelet_threshold_for_strength(float strength, float max_threshold) {
    return std::clamp(strength, 0.0f, 1.0f) * max_threshold;
}

ImageBuffer mean_filter(const ImageBuffer& image, int radius, const core::Deadline& deadline) {
    if (radius <= 0) return image;

    ImageBuffer out(image.height(), image.width(), image.channels(), image.bit_depth());
    const int k = 2 * radius + 1;
    for (int c = 0; c < image.channels(); ++c) {
        deadline.check("mean filter");
        const Matrix2Df& src_plane = image.plane(c);
        Eigen::Ref<Matrix2Df> dst_plane = out.plane(c);
        cv::Mat src(image.height(), image.width(), CV_32F, const_cast<float*>(src_plane.data()));
        cv::Mat dst(image.height(), image.width(), CV_32F, dst_plane.data());
        cv::blur(src, dst, cv::Size(k, k), cv::Point(-1, -1), cv::BORDER_REPLICATE);
    }
    return out;
}

ImageBuffer median_filter(const ImageBuffer& image, int radius, const core::Deadline& deadline) {
    if (radius <= 0) return image;

    const int h = image.height();
    const int w = image.width();
    const int k = 2 * radius + 1;
    ImageBuffer out(h, w, image.channels(), image.bit_depth());
    std::vector<float> window(static_cast<size_t>(k * k));

    for (int c = 0; c < image.channels(); ++c) {
        const Matrix2Df& src = image.plane(c);
        Eigen::Ref<Matrix2Df> dst = out.plane(c);
        for (int y = 0; y < h; ++y) {
            deadline.check("median filter");
            for (int x = 0; x < w; ++x) {
                size_t n = 0;
                for (int dy = -radius; dy <= radius; ++dy) {
                    const int yy = std::clamp(y + dy, 0, h - 1);
                    for (int dx = -radius; dx <= radius; ++dx) {
                        const int xx = std::clamp(x + dx, 0, w - 1);
                        window[n++] = src(yy, xx);
                    }
                }
                dst(y, x) = core::median_of(window);
            }
        }
    }
    return out;
}

ImageBuffer apply_filter(const ImageBuffer& image, FilterKind kind, float strength,
                         const FilterParams& params, const core::Deadline& deadline) {
    if (!std::isfinite(strength) || strength < 0.0f || strength > 1.0f) {
        std::ostringstream oss;
        oss << "strength must be within [0,1], got " << strength;
        throw InvalidStrengthError(oss.str());
    }
    if (image.empty()) {
        throw ProcessError(ProcessStage::FILTER, "image buffer is empty");
    }

    switch (kind) {
        case FilterKind::MEAN:
            return mean_filter(image, radius_for_strength(strength, params.max_radius), deadline);
        case FilterKind::MEDIAN:
            return median_filter(image, radius_for_strength(strength, params.max_radius), deadline);
        case FilterKind::WAVELET:
            return wavelet_denoise(image,
                                   wavelet_threshold_for_strength(strength, params.wavelet_max_threshold),
                                   params.wavelet_levels, params.wavelet_mode, deadline);
        default:
            throw ProcessError(ProcessStage::FILTER, "unknown filter kind");
    }
}

} // namespace image_denoiser::filters
