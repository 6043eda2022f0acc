#include "image_denoiser/io/image_codec.hpp"
#include "image_denoiser/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <utility>

namespace image_denoiser::io {

namespace {

bool has_prefix(const std::vector<uint8_t>& bytes, std::initializer_list<uint8_t> magic) {
    if (bytes.size() < magic.size()) return false;
    return std::equal(magic.begin(), magic.end(), bytes.begin());
}

uint32_t read_be32(const std::vector<uint8_t>& b, size_t off) {
    return (static_cast<uint32_t>(b[off]) << 24) | (static_cast<uint32_t>(b[off + 1]) << 16) |
           (static_cast<uint32_t>(b[off + 2]) << 8) | static_cast<uint32_t>(b[off + 3]);
}

uint16_t read_be16(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint16_t>((b[off] << 8) | b[off + 1]);
}

int32_t read_le32(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<int32_t>(static_cast<uint32_t>(b[off]) |
                                (static_cast<uint32_t>(b[off + 1]) << 8) |
                                (static_cast<uint32_t>(b[off + 2]) << 16) |
                                (static_cast<uint32_t>(b[off + 3]) << 24));
}

uint16_t read_le16(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

using Dimensions = std::pair<long long, long long>;

// BITMAPCOREHEADER (12 bytes) stores unsigned 16-bit sizes; later headers
// store signed 32-bit sizes (negative height means top-down).
std::optional<Dimensions> peek_bmp(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 26) return std::nullopt;
    const int32_t header_size = read_le32(bytes, 14);
    if (header_size == 12) {
        return std::make_pair(static_cast<long long>(read_le16(bytes, 18)),
                              static_cast<long long>(read_le16(bytes, 20)));
    }
    if (header_size < 40) return std::nullopt;
    return std::make_pair(std::llabs(static_cast<long long>(read_le32(bytes, 18))),
                          std::llabs(static_cast<long long>(read_le32(bytes, 22))));
}

std::optional<Dimensions> peek_jpeg(const std::vector<uint8_t>& bytes) {
    size_t pos = 2;
    while (pos + 9 < bytes.size()) {
        if (bytes[pos] != 0xFF) return std::nullopt;
        const uint8_t marker = bytes[pos + 1];
        if (marker == 0xFF) {
            ++pos;
            continue;
        }
        const bool is_sof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 &&
                            marker != 0xC8 && marker != 0xCC;
        if (is_sof) {
            return std::make_pair(static_cast<long long>(read_be16(bytes, pos + 7)),
                                  static_cast<long long>(read_be16(bytes, pos + 5)));
        }
        pos += 2 + read_be16(bytes, pos + 2);
    }
    return std::nullopt;
}

// ImageWidth (256) and ImageLength (257) from the first IFD.
std::optional<Dimensions> peek_tiff(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 8) return std::nullopt;
    const bool little = bytes[0] == 'I';
    auto u16 = [&](size_t off) { return little ? read_le16(bytes, off) : read_be16(bytes, off); };
    auto u32 = [&](size_t off) {
        return little ? static_cast<uint32_t>(read_le32(bytes, off)) : read_be32(bytes, off);
    };

    const size_t ifd = u32(4);
    if (ifd < 8 || ifd + 2 > bytes.size()) return std::nullopt;
    const size_t entries = u16(ifd);

    long long width = -1;
    long long height = -1;
    for (size_t i = 0; i < entries; ++i) {
        const size_t entry = ifd + 2 + 12 * i;
        if (entry + 12 > bytes.size()) return std::nullopt;
        const uint16_t tag = u16(entry);
        if (tag != 256 && tag != 257) continue;

        long long value = -1;
        switch (u16(entry + 2)) {
            case 3: value = u16(entry + 8); break;   // SHORT
            case 4: value = u32(entry + 8); break;   // LONG
            default: return std::nullopt;
        }
        (tag == 256 ? width : height) = value;
        if (width >= 0 && height >= 0) return std::make_pair(width, height);
    }
    return std::nullopt;
}

// Width/height from the container header, without decoding pixels.
std::optional<Dimensions> peek_dimensions(const std::vector<uint8_t>& bytes, ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:
            // Signature (8) + IHDR length/type (8) + width (4) + height (4)
            if (bytes.size() >= 24) {
                return std::make_pair(static_cast<long long>(read_be32(bytes, 16)),
                                      static_cast<long long>(read_be32(bytes, 20)));
            }
            return std::nullopt;
        case ImageFormat::BMP:
            return peek_bmp(bytes);
        case ImageFormat::JPEG:
            return peek_jpeg(bytes);
        case ImageFormat::TIFF:
            return peek_tiff(bytes);
        default:
            return std::nullopt;
    }
}

// libjpeg fills missing scanlines with gray on premature end of data, so a
// complete stream must end with EOI. Only padding may follow it.
bool jpeg_has_eoi(const std::vector<uint8_t>& bytes) {
    size_t end = bytes.size();
    while (end > 0) {
        const uint8_t b = bytes[end - 1];
        if (b != 0x00 && b != 0x0A && b != 0x0D && b != 0x20) break;
        --end;
    }
    return end >= 4 && bytes[end - 2] == 0xFF && bytes[end - 1] == 0xD9;
}

void check_pixel_budget(long long width, long long height, long long max_pixels) {
    if (max_pixels > 0 && width * height > max_pixels) {
        throw UploadTooLargeError("image is " + std::to_string(width) + "x" +
                                  std::to_string(height) + " pixels, limit is " +
                                  std::to_string(max_pixels) + " pixels");
    }
}

} // namespace

ImageFormat sniff_format(const std::vector<uint8_t>& bytes) {
    if (has_prefix(bytes, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) return ImageFormat::PNG;
    if (has_prefix(bytes, {0xFF, 0xD8, 0xFF})) return ImageFormat::JPEG;
    if (has_prefix(bytes, {'B', 'M'}) && bytes.size() >= 26) return ImageFormat::BMP;
    if (has_prefix(bytes, {'I', 'I', 0x2A, 0x00}) || has_prefix(bytes, {'M', 'M', 0x00, 0x2A})) {
        return ImageFormat::TIFF;
    }
    return ImageFormat::UNKNOWN;
}

ImageBuffer decode_image(const std::vector<uint8_t>& bytes, long long max_pixels) {
    if (bytes.empty()) {
        throw DecodeError("upload is empty");
    }

    const ImageFormat format = sniff_format(bytes);
    if (format == ImageFormat::UNKNOWN) {
        throw DecodeError("not a supported image format (expected PNG, JPEG, BMP or TIFF)");
    }

    const auto dims = peek_dimensions(bytes, format);
    if (!dims || dims->first <= 0 || dims->second <= 0) {
        throw DecodeError("cannot read image dimensions from " + image_format_to_string(format) +
                          " header");
    }
    check_pixel_budget(dims->first, dims->second, max_pixels);

    if (format == ImageFormat::JPEG && !jpeg_has_eoi(bytes)) {
        throw DecodeError("jpeg data is truncated");
    }

    cv::Mat decoded;
    try {
        cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8U, const_cast<uint8_t*>(bytes.data()));
        decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(image_format_to_string(format) + " data is corrupt (" + e.msg + ")");
    }
    if (decoded.empty()) {
        throw DecodeError(image_format_to_string(format) + " data is corrupt or truncated");
    }
    check_pixel_budget(decoded.cols, decoded.rows, max_pixels);

    float scale = 1.0f;
    int bit_depth = 8;
    switch (decoded.depth()) {
        case CV_8U:
            scale = 1.0f / 255.0f;
            break;
        case CV_16U:
            scale = 1.0f / 65535.0f;
            bit_depth = 16;
            break;
        case CV_32F:
            bit_depth = 16;
            break;
        default:
            throw DecodeError("unsupported sample depth in " + image_format_to_string(format) + " data");
    }

    cv::Mat samples;
    decoded.convertTo(samples, CV_32F, scale);

    const int src_channels = samples.channels();
    const int channels = (src_channels <= 2) ? 1 : 3;
    ImageBuffer image(samples.rows, samples.cols, channels, bit_depth);

    std::vector<cv::Mat> split;
    cv::split(samples, split);

    // OpenCV channel order is BGR(A); the buffer is RGB.
    for (int c = 0; c < channels; ++c) {
        const int src = (channels == 1) ? 0 : 2 - c;
        const cv::Mat& plane = split[static_cast<size_t>(src)];
        Eigen::Ref<Matrix2Df> dst = image.plane(c);
        for (int y = 0; y < plane.rows; ++y) {
            const float* row = plane.ptr<float>(y);
            for (int x = 0; x < plane.cols; ++x) {
                dst(y, x) = row[x];
            }
        }
    }

    image.clamp_unit();
    return image;
}

std::vector<uint8_t> encode_image(const ImageBuffer& image, const EncodeOptions& options) {
    if (image.empty()) {
        throw ProcessError(ProcessStage::ENCODE, "image buffer is empty");
    }

    const bool wide = image.bit_depth() == 16 &&
                      (options.format == ImageFormat::PNG || options.format == ImageFormat::TIFF);
    const int depth = wide ? CV_16U : CV_8U;
    const float full_scale = wide ? 65535.0f : 255.0f;

    std::vector<cv::Mat> planes;
    planes.reserve(static_cast<size_t>(image.channels()));
    for (int c = image.channels() - 1; c >= 0; --c) {
        // Reverse order: RGB buffer -> BGR for OpenCV.
        const Matrix2Df& src = image.plane(c);
        cv::Mat plane(image.height(), image.width(), depth);
        for (int y = 0; y < image.height(); ++y) {
            for (int x = 0; x < image.width(); ++x) {
                const float v = std::clamp(src(y, x), 0.0f, 1.0f);
                const float q = std::round(v * full_scale);
                if (wide) {
                    plane.at<uint16_t>(y, x) = static_cast<uint16_t>(q);
                } else {
                    plane.at<uint8_t>(y, x) = static_cast<uint8_t>(q);
                }
            }
        }
        planes.push_back(plane);
    }

    cv::Mat merged;
    cv::merge(planes, merged);

    std::string ext;
    std::vector<int> params;
    switch (options.format) {
        case ImageFormat::PNG:
            ext = ".png";
            params = {cv::IMWRITE_PNG_COMPRESSION, options.png_compression};
            break;
        case ImageFormat::JPEG:
            ext = ".jpg";
            params = {cv::IMWRITE_JPEG_QUALITY, options.jpeg_quality};
            break;
        case ImageFormat::BMP:
            ext = ".bmp";
            break;
        case ImageFormat::TIFF:
            ext = ".tiff";
            break;
        default:
            throw ProcessError(ProcessStage::ENCODE, "unsupported output format");
    }

    std::vector<uint8_t> out;
    try {
        if (!cv::imencode(ext, merged, out, params)) {
            throw ProcessError(ProcessStage::ENCODE,
                               "encoder rejected the image as " + image_format_to_string(options.format));
        }
    } catch (const cv::Exception& e) {
        throw ProcessError(ProcessStage::ENCODE, e.msg);
    }
    return out;
}

} // namespace image_denoiser::io
