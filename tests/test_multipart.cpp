#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/service/multipart.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace image_denoiser;
using namespace image_denoiser::service;

namespace {

const std::string kBoundary = "----denoiseBoundary7MA4YWxk";

std::string field(const std::string& name, const std::string& value) {
    return "--" + kBoundary + "\r\n" +
           "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n" + value + "\r\n";
}

std::string file_field(const std::string& filename, const std::string& type, const std::string& data) {
    return "--" + kBoundary + "\r\n" +
           "Content-Disposition: form-data; name=\"file\"; filename=\"" + filename + "\"\r\n" +
           "Content-Type: " + type + "\r\n\r\n" + data + "\r\n";
}

std::string closing() { return "--" + kBoundary + "--\r\n"; }

} // namespace

TEST_CASE("multipart_boundary_from_content_type") {
    REQUIRE(multipart_boundary("multipart/form-data; boundary=abc123") == std::string("abc123"));
    REQUIRE(multipart_boundary("Multipart/Form-Data; charset=utf-8; boundary=\"quoted b\"") ==
            std::string("quoted b"));
    REQUIRE_FALSE(multipart_boundary("application/json").has_value());
    REQUIRE_FALSE(multipart_boundary("multipart/form-data").has_value());
    REQUIRE_FALSE(multipart_boundary("multipart/form-data; boundary=").has_value());
    REQUIRE_FALSE(multipart_boundary("").has_value());
}

TEST_CASE("parse_multipart_reads_fields_and_file") {
    const std::string body = "preamble is ignored\r\n" + field("method", "median") +
                             field("strength", "0.3") + file_field("noisy.png", "image/png", "PNGDATA") +
                             closing();

    const auto parts = parse_multipart(body, kBoundary);
    REQUIRE(parts.size() == 3);

    const MultipartPart* method = find_part(parts, "method");
    REQUIRE(method != nullptr);
    REQUIRE(method->data == "median");
    REQUIRE(method->filename.empty());

    const MultipartPart* strength = find_part(parts, "strength");
    REQUIRE(strength != nullptr);
    REQUIRE(strength->data == "0.3");

    const MultipartPart* file = find_part(parts, "file");
    REQUIRE(file != nullptr);
    REQUIRE(file->filename == "noisy.png");
    REQUIRE(file->content_type == "image/png");
    REQUIRE(file->headers.at("content-type") == "image/png");
    REQUIRE(file->data == "PNGDATA");

    REQUIRE(find_part(parts, "other") == nullptr);
}

TEST_CASE("parse_multipart_keeps_binary_payload_intact") {
    std::string payload("\x89PNG\r\n\x1a\n", 8);
    payload += std::string("\0\0\r\n--not-the-boundary\r\n\xff\xfe", 26);
    payload.push_back('\0');

    const std::string body = file_field("bin.png", "application/octet-stream", payload) + closing();
    const auto parts = parse_multipart(body, kBoundary);
    REQUIRE(parts.size() == 1);
    REQUIRE(parts[0].data.size() == payload.size());
    REQUIRE(parts[0].data == payload);
}

TEST_CASE("parse_multipart_accepts_empty_values") {
    const std::string body = field("strength", "") + field("method", "") + closing();
    const auto parts = parse_multipart(body, kBoundary);
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[0].data.empty());
    REQUIRE(parts[1].data.empty());
}

TEST_CASE("parse_multipart_rejects_malformed_bodies") {
    SECTION("boundary absent") {
        REQUIRE_THROWS_AS(parse_multipart("no multipart here", kBoundary), InvalidUploadError);
    }
    SECTION("empty boundary") {
        REQUIRE_THROWS_AS(parse_multipart(field("a", "b") + closing(), ""), InvalidUploadError);
    }
    SECTION("unterminated headers") {
        const std::string body = "--" + kBoundary + "\r\nContent-Disposition: form-data; name=\"a\"";
        REQUIRE_THROWS_AS(parse_multipart(body, kBoundary), InvalidUploadError);
    }
    SECTION("missing content disposition") {
        const std::string body = "--" + kBoundary + "\r\nContent-Type: text/plain\r\n\r\nx\r\n" + closing();
        REQUIRE_THROWS_AS(parse_multipart(body, kBoundary), InvalidUploadError);
    }
    SECTION("missing field name") {
        const std::string body =
            "--" + kBoundary + "\r\nContent-Disposition: form-data\r\n\r\nx\r\n" + closing();
        REQUIRE_THROWS_AS(parse_multipart(body, kBoundary), InvalidUploadError);
    }
    SECTION("truncated part") {
        const std::string body = file_field("a.png", "image/png", "partial").substr(0, 90);
        REQUIRE_THROWS_AS(parse_multipart(body, kBoundary), InvalidUploadError);
    }
    SECTION("garbage after delimiter") {
        const std::string body = "--" + kBoundary + "XYZ\r\n";
        REQUIRE_THROWS_AS(parse_multipart(body, kBoundary), InvalidUploadError);
    }
}
