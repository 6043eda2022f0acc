#include "image_denoiser/filters/wavelet.hpp"
#include "image_denoiser/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace image_denoiser::filters {

namespace {

constexpr float kInvSqrt2 = 0.70710678118654752f;

void haar_rows_forward(Matrix2Df& m, int rows, int cols) {
    const int half = cols / 2;
    std::vector<float> tmp(static_cast<size_t>(cols));
    for (int y = 0; y < rows; ++y) {
        for (int i = 0; i < half; ++i) {
            const float a = m(y, 2 * i);
            const float b = m(y, 2 * i + 1);
            tmp[static_cast<size_t>(i)] = (a + b) * kInvSqrt2;
            tmp[static_cast<size_t>(half + i)] = (a - b) * kInvSqrt2;
        }
        for (int x = 0; x < cols; ++x) m(y, x) = tmp[static_cast<size_t>(x)];
    }
}

void haar_cols_forward(Matrix2Df& m, int rows, int cols) {
    const int half = rows / 2;
    std::vector<float> tmp(static_cast<size_t>(rows));
    for (int x = 0; x < cols; ++x) {
        for (int i = 0; i < half; ++i) {
            const float a = m(2 * i, x);
            const float b = m(2 * i + 1, x);
            tmp[static_cast<size_t>(i)] = (a + b) * kInvSqrt2;
            tmp[static_cast<size_t>(half + i)] = (a - b) * kInvSqrt2;
        }
        for (int y = 0; y < rows; ++y) m(y, x) = tmp[static_cast<size_t>(y)];
    }
}

void haar_rows_inverse(Matrix2Df& m, int rows, int cols) {
    const int half = cols / 2;
    std::vector<float> tmp(static_cast<size_t>(cols));
    for (int y = 0; y < rows; ++y) {
        for (int i = 0; i < half; ++i) {
            const float l = m(y, i);
            const float d = m(y, half + i);
            tmp[static_cast<size_t>(2 * i)] = (l + d) * kInvSqrt2;
            tmp[static_cast<size_t>(2 * i + 1)] = (l - d) * kInvSqrt2;
        }
        for (int x = 0; x < cols; ++x) m(y, x) = tmp[static_cast<size_t>(x)];
    }
}

void haar_cols_inverse(Matrix2Df& m, int rows, int cols) {
    const int half = rows / 2;
    std::vector<float> tmp(static_cast<size_t>(rows));
    for (int x = 0; x < cols; ++x) {
        for (int i = 0; i < half; ++i) {
            const float l = m(i, x);
            const float d = m(half + i, x);
            tmp[static_cast<size_t>(2 * i)] = (l + d) * kInvSqrt2;
            tmp[static_cast<size_t>(2 * i + 1)] = (l - d) * kInvSqrt2;
        }
        for (int y = 0; y < rows; ++y) m(y, x) = tmp[static_cast<size_t>(y)];
    }
}

int round_up_to_multiple(int v, int m) {
    return ((v + m - 1) / m) * m;
}

} // namespace

Matrix2Df haar_forward(const Matrix2Df& plane, int levels) {
    const int block = 1 << levels;
    if (plane.rows() % block != 0 || plane.cols() % block != 0) {
        throw ProcessError(ProcessStage::FILTER, "wavelet input is not a multiple of 2^levels");
    }
    Matrix2Df m = plane;
    int rows = static_cast<int>(m.rows());
    int cols = static_cast<int>(m.cols());
    for (int l = 0; l < levels; ++l) {
        haar_rows_forward(m, rows, cols);
        haar_cols_forward(m, rows, cols);
        rows /= 2;
        cols /= 2;
    }
    return m;
}

Matrix2Df haar_inverse(const Matrix2Df& coeffs, int levels) {
    const int block = 1 << levels;
    if (coeffs.rows() % block != 0 || coeffs.cols() % block != 0) {
        throw ProcessError(ProcessStage::FILTER, "wavelet input is not a multiple of 2^levels");
    }
    Matrix2Df m = coeffs;
    for (int l = levels - 1; l >= 0; --l) {
        const int rows = static_cast<int>(m.rows()) >> l;
        const int cols = static_cast<int>(m.cols()) >> l;
        haar_cols_inverse(m, rows, cols);
        haar_rows_inverse(m, rows, cols);
    }
    return m;
}

Matrix2Df pad_replicate(const Matrix2Df& plane, int rows, int cols) {
    const int h = static_cast<int>(plane.rows());
    const int w = static_cast<int>(plane.cols());
    if (rows == h && cols == w) return plane;

    Matrix2Df out(rows, cols);
    for (int y = 0; y < rows; ++y) {
        const int sy = std::min(y, h - 1);
        for (int x = 0; x < cols; ++x) {
            out(y, x) = plane(sy, std::min(x, w - 1));
        }
    }
    return out;
}

float soft_threshold(float value, float threshold) {
    if (value > threshold) return value - threshold;
    if (value < -threshold) return value + threshold;
    return 0.0f;
}

float hard_threshold(float value, float threshold) {
    return (std::fabs(value) > threshold) ? value : 0.0f;
}

ImageBuffer wavelet_denoise(const ImageBuffer& image, float threshold, int levels,
                            ThresholdMode mode, const core::Deadline& deadline) {
    if (!(threshold > 0.0f)) return image;
    if (levels < 1) {
        throw ProcessError(ProcessStage::FILTER, "wavelet levels must be >= 1");
    }

    const int h = image.height();
    const int w = image.width();
    const int block = 1 << levels;
    const int ph = round_up_to_multiple(h, block);
    const int pw = round_up_to_multiple(w, block);
    const int approx_rows = ph >> levels;
    const int approx_cols = pw >> levels;

    ImageBuffer out(h, w, image.channels(), image.bit_depth());
    for (int c = 0; c < image.channels(); ++c) {
        deadline.check("wavelet filter");
        Matrix2Df coeffs = haar_forward(pad_replicate(image.plane(c), ph, pw), levels);

        // The approximation block is kept; every other coefficient is detail.
        for (int y = 0; y < ph; ++y) {
            for (int x = 0; x < pw; ++x) {
                if (y < approx_rows && x < approx_cols) continue;
                float& v = coeffs(y, x);
                v = (mode == ThresholdMode::SOFT) ? soft_threshold(v, threshold)
                                                  : hard_threshold(v, threshold);
            }
        }

        deadline.check("wavelet filter");
        Matrix2Df restored = haar_inverse(coeffs, levels);
        out.plane(c) = restored.topLeftCorner(h, w);
    }
    out.clamp_unit();
    return out;
}

} // namespace image_denoiser::filters
