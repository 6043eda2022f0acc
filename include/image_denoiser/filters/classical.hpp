#pragma once

#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/deadline.hpp"
#include "image_denoiser/core/types.hpp"

#include <string>

namespace image_denoiser::filters {

enum class FilterKind {
    MEAN,
    MEDIAN,
    WAVELET
};

std::string filter_kind_to_string(FilterKind kind);

enum class ThresholdMode {
    SOFT,
    HARD
};

struct FilterParams {
    int max_radius = 5;
    int wavelet_levels = 2;
    float wavelet_max_threshold = 0.1f;
    ThresholdMode wavelet_mode = ThresholdMode::SOFT;

    static FilterParams from_config(const config::FiltersConfig& cfg);
};

// Window radius for a strength in [0,1]: round(strength * max_radius).
// Radius 0 means the filter is the identity.
int radius_for_strength(float strength, int max_radius);

// Detail-coefficient threshold for a strength in [0,1].
float wavelet_threshold_for_strength(float strength, float max_threshold);

// Box average over a (2r+1)^2 window, replicate border.
ImageBuffer mean_filter(const ImageBuffer& image, int radius,
                        const core::Deadline& deadline = core::Deadline::none());

// Per-channel median over a (2r+1)^2 window, replicate border.
ImageBuffer median_filter(const ImageBuffer& image, int radius,
                          const core::Deadline& deadline = core::Deadline::none());

// Maps strength to the filter parameter and runs the filter. Output has
// the geometry of the input. Throws InvalidStrengthError for strength
// outside [0,1] and TimeoutError when the deadline passes.
ImageBuffer apply_filter(const ImageBuffer& image, FilterKind kind, float strength,
                         const FilterParams& params,
                         const core::Deadline& deadline = core::Deadline::none());

} // namespace image_denoiser::filters
