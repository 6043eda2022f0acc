#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/io/image_codec.hpp"
#include "image_denoiser/pipeline/dispatcher.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace image_denoiser;
using pipeline::DenoiseRequest;
using pipeline::Dispatcher;

namespace {

cdae::ModelHandle::Loader identity_loader(int channels, int tile) {
    return [channels, tile]() -> std::unique_ptr<cdae::DenoisingModel> {
        return test::identity_model(channels, tile);
    };
}

std::vector<uint8_t> png_bytes(int h, int w, int c) {
    return io::encode_image(test::make_noisy(h, w, c));
}

core::Deadline already_expired() {
    return core::Deadline::at(core::Deadline::Clock::now() - std::chrono::seconds(1));
}

} // namespace

// ============================================================================
// Field parsing
// ============================================================================

TEST_CASE("parse_strength_accepts_numbers_in_unit_interval") {
    REQUIRE(pipeline::parse_strength("0") == 0.0f);
    REQUIRE(pipeline::parse_strength("1") == 1.0f);
    REQUIRE(pipeline::parse_strength("0.25") == Catch::Approx(0.25f));
    REQUIRE(pipeline::parse_strength(" 0.75 ") == Catch::Approx(0.75f));
    REQUIRE(pipeline::parse_strength("1e-1") == Catch::Approx(0.1f));
    REQUIRE(pipeline::parse_strength("") == Catch::Approx(0.5f));
    REQUIRE(pipeline::parse_strength("   ") == Catch::Approx(0.5f));
}

TEST_CASE("parse_strength_treats_underflow_as_zero") {
    REQUIRE(pipeline::parse_strength("1e-40") == Catch::Approx(0.0f).margin(1e-30));
    REQUIRE(pipeline::parse_strength("1e-400") == Catch::Approx(0.0f).margin(1e-30));
    REQUIRE(pipeline::parse_strength("0.000000000000000000000000000000000000000000001") ==
            Catch::Approx(0.0f).margin(1e-30));
    REQUIRE_THROWS_AS(pipeline::parse_strength("1e400"), InvalidStrengthError);
}

TEST_CASE("parse_strength_rejects_everything_else") {
    for (const char* bad : {"-0.1", "1.01", "2", "abc", "0.5x", "nan", "inf", "-inf", "1e40", "0,5"}) {
        INFO(bad);
        REQUIRE_THROWS_AS(pipeline::parse_strength(bad), InvalidStrengthError);
    }
}

TEST_CASE("parse_method_is_case_insensitive_with_cdae_default") {
    REQUIRE(pipeline::parse_method("") == DenoiseMethod::CDAE);
    REQUIRE(pipeline::parse_method("cdae") == DenoiseMethod::CDAE);
    REQUIRE(pipeline::parse_method(" Mean ") == DenoiseMethod::MEAN);
    REQUIRE(pipeline::parse_method("MEDIAN") == DenoiseMethod::MEDIAN);
    REQUIRE(pipeline::parse_method("wavelet") == DenoiseMethod::WAVELET);
    REQUIRE_THROWS_AS(pipeline::parse_method("bilateral"), InvalidMethodError);
}

TEST_CASE("request_fields_are_validated_before_the_image") {
    const std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    REQUIRE_THROWS_AS(DenoiseRequest::from_fields(garbage, "bogus", "0.5"), InvalidMethodError);
    REQUIRE_THROWS_AS(DenoiseRequest::from_fields(garbage, "mean", "1.5"), InvalidStrengthError);

    const DenoiseRequest req = DenoiseRequest::from_fields(garbage, "", "");
    REQUIRE(req.method == DenoiseMethod::CDAE);
    REQUIRE(req.strength == Catch::Approx(0.5f));
    REQUIRE(req.image == garbage);
}

// ============================================================================
// Processing
// ============================================================================

TEST_CASE("every_method_preserves_dimensions") {
    config::Config cfg;
    cdae::ModelHandle model("identity", identity_loader(1, 16));
    const Dispatcher dispatcher(cfg, model);

    for (int channels : {1, 3}) {
        const auto bytes = png_bytes(23, 41, channels);
        for (const char* method : {"cdae", "mean", "median", "wavelet"}) {
            for (const char* strength : {"0", "0.5", "1"}) {
                INFO(method << " s=" << strength << " c=" << channels);
                const auto result = dispatcher.process(DenoiseRequest::from_fields(bytes, method, strength));
                REQUIRE(result.content_type == "image/png");
                REQUIRE(result.width == 41);
                REQUIRE(result.height == 23);
                REQUIRE(result.channels == channels);

                const ImageBuffer decoded = io::decode_image(result.data);
                REQUIRE(decoded.width() == 41);
                REQUIRE(decoded.height() == 23);
                REQUIRE(decoded.channels() == channels);
            }
        }
    }
}

TEST_CASE("zero_strength_round_trips_lossless_input") {
    config::Config cfg;
    cdae::ModelHandle model("identity", identity_loader(1, 16));
    const Dispatcher dispatcher(cfg, model);

    const ImageBuffer img = test::make_gradient(12, 20, 3);
    const auto bytes = io::encode_image(img);
    for (const char* method : {"cdae", "mean", "median", "wavelet"}) {
        const auto result = dispatcher.process(DenoiseRequest::from_fields(bytes, method, "0"));
        REQUIRE(test::max_abs_diff(img, io::decode_image(result.data)) < 1e-6f);
    }
}

TEST_CASE("text_upload_is_a_decode_error") {
    config::Config cfg;
    cdae::ModelHandle model("identity", identity_loader(1, 16));
    const Dispatcher dispatcher(cfg, model);

    const std::string text = "hello, this is a text file";
    const auto req = DenoiseRequest::from_fields(std::vector<uint8_t>(text.begin(), text.end()), "mean", "0.5");
    REQUIRE_THROWS_AS(dispatcher.process(req), DecodeError);
}

TEST_CASE("missing_model_only_affects_cdae") {
    config::Config cfg;
    cfg.model.path = "/nonexistent/cdae.yml";
    cdae::ModelHandle model(cfg.model);
    const Dispatcher dispatcher(cfg, model);

    const auto bytes = png_bytes(16, 16, 1);
    REQUIRE_THROWS_AS(dispatcher.process(DenoiseRequest::from_fields(bytes, "cdae", "0.5")),
                      ModelUnavailableError);
    REQUIRE_NOTHROW(dispatcher.process(DenoiseRequest::from_fields(bytes, "mean", "0.5")));
    REQUIRE_THROWS_AS(dispatcher.process(DenoiseRequest::from_fields(bytes, "cdae", "0.5")),
                      ModelUnavailableError);
    REQUIRE(model.load_count() == 1);
}

TEST_CASE("timeout_does_not_poison_later_requests") {
    config::Config cfg;
    cdae::ModelHandle model("identity", identity_loader(1, 16));
    const Dispatcher dispatcher(cfg, model);
    const auto req = DenoiseRequest::from_fields(png_bytes(64, 64, 3), "median", "1");

    REQUIRE_THROWS_AS(dispatcher.process(req, already_expired()), TimeoutError);
    const auto result = dispatcher.process(req, core::Deadline::after(std::chrono::seconds(60)));
    REQUIRE(result.width == 64);
}

TEST_CASE("direct_requests_with_bad_strength_are_rejected") {
    config::Config cfg;
    cdae::ModelHandle model("identity", identity_loader(1, 16));
    const Dispatcher dispatcher(cfg, model);

    DenoiseRequest req;
    req.image = png_bytes(8, 8, 1);
    req.method = DenoiseMethod::MEAN;
    req.strength = 3.0f;
    REQUIRE_THROWS_AS(dispatcher.process(req), InvalidStrengthError);
    REQUIRE_THROWS_AS(dispatcher.denoise(test::make_gradient(4, 4, 1), DenoiseMethod::WAVELET, -1.0f),
                      InvalidStrengthError);
}

TEST_CASE("pixel_budget_is_enforced_on_decode") {
    config::Config cfg;
    cfg.limits.max_pixels = 100;
    cdae::ModelHandle model("identity", identity_loader(1, 16));
    const Dispatcher dispatcher(cfg, model);
    REQUIRE_THROWS_AS(dispatcher.process(DenoiseRequest::from_fields(png_bytes(20, 20, 1), "mean", "0.5")),
                      UploadTooLargeError);
}

TEST_CASE("output_format_follows_configuration") {
    config::Config cfg;
    cfg.output.format = "jpeg";
    cdae::ModelHandle model("identity", identity_loader(1, 16));
    const Dispatcher dispatcher(cfg, model);
    REQUIRE(dispatcher.encode_options().format == ImageFormat::JPEG);

    const auto result = dispatcher.process(DenoiseRequest::from_fields(png_bytes(16, 24, 3), "wavelet", "0.4"));
    REQUIRE(result.content_type == "image/jpeg");
    REQUIRE(io::sniff_format(result.data) == ImageFormat::JPEG);

    cfg.output.format = "gif";
    REQUIRE_THROWS_AS(Dispatcher(cfg, model), ConfigError);
}
