#pragma once

#include "image_denoiser/core/deadline.hpp"
#include "image_denoiser/core/types.hpp"
#include "image_denoiser/filters/classical.hpp"

namespace image_denoiser::filters {

// Multi-level orthonormal Haar transform in Mallat layout: after level l
// the top-left (rows >> (l+1)) x (cols >> (l+1)) block holds the
// approximation. rows and cols must be divisible by 2^levels.
Matrix2Df haar_forward(const Matrix2Df& plane, int levels);
Matrix2Df haar_inverse(const Matrix2Df& coeffs, int levels);

// Grow a plane to rows x cols by repeating the last row/column.
Matrix2Df pad_replicate(const Matrix2Df& plane, int rows, int cols);

float soft_threshold(float value, float threshold);
float hard_threshold(float value, float threshold);

// Per-channel Haar shrinkage of all detail bands. Dimensions that are not
// multiples of 2^levels are padded and cropped back. threshold <= 0 returns
// the input unchanged.
ImageBuffer wavelet_denoise(const ImageBuffer& image, float threshold, int levels,
                            ThresholdMode mode,
                            const core::Deadline& deadline = core::Deadline::none());

} // namespace image_denoiser::filters
