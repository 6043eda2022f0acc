#include "image_denoiser/core/types.hpp"
#include "image_denoiser/core/errors.hpp"

namespace image_denoiser {

ImageBuffer::ImageBuffer(int height, int width, int channels, int bit_depth)
    : height_(height), width_(width), bit_depth_(bit_depth) {
    if (height <= 0 || width <= 0) {
        throw ValidationError("image dimensions must be positive, got " +
                              std::to_string(width) + "x" + std::to_string(height));
    }
    if (channels != 1 && channels != 3) {
        throw ValidationError("image must have 1 or 3 channels, got " +
                              std::to_string(channels));
    }
    if (bit_depth != 8 && bit_depth != 16) {
        throw ValidationError("bit depth must be 8 or 16, got " + std::to_string(bit_depth));
    }
    planes_.assign(static_cast<size_t>(channels), Matrix2Df::Zero(height, width));
}

void ImageBuffer::clamp_unit() {
    for (auto& p : planes_) {
        p = p.cwiseMax(0.0f).cwiseMin(1.0f);
    }
}

} // namespace image_denoiser
