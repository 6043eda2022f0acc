#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/filters/classical.hpp"
#include "image_denoiser/filters/wavelet.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace image_denoiser;
using filters::FilterKind;

namespace {

const FilterKind kAllKinds[] = {FilterKind::MEAN, FilterKind::MEDIAN, FilterKind::WAVELET};

core::Deadline already_expired() {
    return core::Deadline::at(core::Deadline::Clock::now() - std::chrono::seconds(1));
}

} // namespace

TEST_CASE("strength_maps_to_radius_and_threshold") {
    REQUIRE(filters::radius_for_strength(0.0f, 5) == 0);
    REQUIRE(filters::radius_for_strength(0.2f, 5) == 1);
    REQUIRE(filters::radius_for_strength(0.6f, 5) == 3);
    REQUIRE(filters::radius_for_strength(1.0f, 5) == 5);
    REQUIRE(filters::wavelet_threshold_for_strength(0.0f, 0.1f) == 0.0f);
    REQUIRE(filters::wavelet_threshold_for_strength(0.5f, 0.1f) == Catch::Approx(0.05f));
    REQUIRE(filters::wavelet_threshold_for_strength(1.0f, 0.1f) == Catch::Approx(0.1f));
}

TEST_CASE("zero_strength_is_identity_for_every_filter") {
    const ImageBuffer img = test::make_noisy(19, 27, 3);
    const filters::FilterParams params;
    for (FilterKind kind : kAllKinds) {
        const ImageBuffer out = filters::apply_filter(img, kind, 0.0f, params);
        INFO(filters::filter_kind_to_string(kind));
        REQUIRE(test::same_pixels(img, out));
    }
}

TEST_CASE("filters_preserve_geometry_at_every_strength") {
    const filters::FilterParams params;
    const int sizes[][2] = {{1, 1}, {7, 13}, {16, 16}, {33, 5}, {64, 96}};
    for (const auto& hw : sizes) {
        for (int channels : {1, 3}) {
            const ImageBuffer img = test::make_noisy(hw[0], hw[1], channels);
            for (FilterKind kind : kAllKinds) {
                for (float s : {0.0f, 0.3f, 0.7f, 1.0f}) {
                    const ImageBuffer out = filters::apply_filter(img, kind, s, params);
                    INFO(filters::filter_kind_to_string(kind) << " " << hw[0] << "x" << hw[1]
                                                              << "x" << channels << " s=" << s);
                    REQUIRE(out.same_geometry(img));
                    REQUIRE(out.bit_depth() == img.bit_depth());
                }
            }
        }
    }
}

TEST_CASE("filter_effect_grows_with_strength") {
    const ImageBuffer img = test::make_noisy(32, 32, 1, 7u, 0.08f);
    const filters::FilterParams params;
    for (FilterKind kind : kAllKinds) {
        double previous = 0.0;
        for (float s : {0.0f, 0.2f, 0.4f, 0.6f, 0.8f, 1.0f}) {
            const double change = test::rms_diff(img, filters::apply_filter(img, kind, s, params));
            INFO(filters::filter_kind_to_string(kind) << " s=" << s);
            REQUIRE(change + 1e-9 >= previous);
            previous = change;
        }
        REQUIRE(previous > 0.0);
    }
}

TEST_CASE("full_strength_uses_the_configured_maximum") {
    const ImageBuffer img = test::make_noisy(24, 24, 1);
    filters::FilterParams params;
    params.max_radius = 4;

    const ImageBuffer via_strength = filters::apply_filter(img, FilterKind::MEAN, 1.0f, params);
    const ImageBuffer direct = filters::mean_filter(img, 4);
    REQUIRE(test::same_pixels(via_strength, direct));

    const ImageBuffer median_max = filters::apply_filter(img, FilterKind::MEDIAN, 1.0f, params);
    REQUIRE(test::same_pixels(median_max, filters::median_filter(img, 4)));
}

TEST_CASE("median_removes_a_single_outlier") {
    ImageBuffer img = test::make_constant(9, 9, 1, 0.5f);
    img.plane(0)(4, 4) = 1.0f;
    img.plane(0)(0, 0) = 0.0f;

    const ImageBuffer out = filters::median_filter(img, 1);
    REQUIRE(out.plane(0)(4, 4) == 0.5f);
    REQUIRE(out.plane(0)(0, 0) == 0.5f);
    REQUIRE(out.plane(0).maxCoeff() == 0.5f);
    REQUIRE(out.plane(0).minCoeff() == 0.5f);
}

TEST_CASE("mean_and_wavelet_keep_constant_images") {
    const ImageBuffer img = test::make_constant(20, 14, 3, 0.25f);
    const filters::FilterParams params;
    for (FilterKind kind : {FilterKind::MEAN, FilterKind::WAVELET}) {
        const ImageBuffer out = filters::apply_filter(img, kind, 1.0f, params);
        REQUIRE(test::max_abs_diff(img, out) < 1e-5f);
    }
}

TEST_CASE("haar_transform_is_orthonormal_and_invertible") {
    Matrix2Df plane(8, 12);
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 12; ++x) {
            plane(y, x) = static_cast<float>((y * 31 + x * 17) % 11) / 11.0f;
        }
    }
    const Matrix2Df coeffs = filters::haar_forward(plane, 2);
    REQUIRE(coeffs.squaredNorm() == Catch::Approx(plane.squaredNorm()).epsilon(1e-5));
    const Matrix2Df back = filters::haar_inverse(coeffs, 2);
    REQUIRE((back - plane).cwiseAbs().maxCoeff() < 1e-5f);

    REQUIRE_THROWS_AS(filters::haar_forward(Matrix2Df::Zero(6, 8), 2), ProcessError);
}

TEST_CASE("threshold_functions") {
    REQUIRE(filters::soft_threshold(0.3f, 0.1f) == Catch::Approx(0.2f));
    REQUIRE(filters::soft_threshold(-0.3f, 0.1f) == Catch::Approx(-0.2f));
    REQUIRE(filters::soft_threshold(0.05f, 0.1f) == 0.0f);
    REQUIRE(filters::hard_threshold(0.3f, 0.1f) == 0.3f);
    REQUIRE(filters::hard_threshold(-0.05f, 0.1f) == 0.0f);
}

TEST_CASE("pad_replicate_repeats_edges") {
    Matrix2Df plane(2, 2);
    plane << 1.0f, 2.0f,
             3.0f, 4.0f;
    const Matrix2Df padded = filters::pad_replicate(plane, 4, 3);
    REQUIRE(padded.rows() == 4);
    REQUIRE(padded.cols() == 3);
    REQUIRE(padded(3, 2) == 4.0f);
    REQUIRE(padded(0, 2) == 2.0f);
    REQUIRE(padded(3, 0) == 3.0f);
}

TEST_CASE("hard_and_soft_wavelet_modes_differ") {
    const ImageBuffer img = test::make_noisy(32, 32, 1, 3u, 0.1f);
    const ImageBuffer soft = filters::wavelet_denoise(img, 0.08f, 2, filters::ThresholdMode::SOFT);
    const ImageBuffer hard = filters::wavelet_denoise(img, 0.08f, 2, filters::ThresholdMode::HARD);
    REQUIRE(soft.same_geometry(img));
    REQUIRE(hard.same_geometry(img));
    REQUIRE_FALSE(test::same_pixels(soft, hard));
}

TEST_CASE("invalid_strength_is_rejected") {
    const ImageBuffer img = test::make_gradient(4, 4, 1);
    const filters::FilterParams params;
    for (float s : {-0.1f, 1.5f, std::numeric_limits<float>::quiet_NaN(),
                    std::numeric_limits<float>::infinity()}) {
        REQUIRE_THROWS_AS(filters::apply_filter(img, FilterKind::MEAN, s, params), InvalidStrengthError);
    }
}

TEST_CASE("expired_deadline_stops_filters") {
    const ImageBuffer img = test::make_noisy(32, 32, 3);
    const filters::FilterParams params;
    for (FilterKind kind : kAllKinds) {
        REQUIRE_THROWS_AS(filters::apply_filter(img, kind, 0.8f, params, already_expired()), TimeoutError);
    }
}
