#pragma once

#include "image_denoiser/core/types.hpp"

#include <cstdint>
#include <vector>

namespace image_denoiser::io {

struct EncodeOptions {
    ImageFormat format = ImageFormat::PNG;
    int png_compression = 3;
    int jpeg_quality = 95;
};

// Identify a raster container from its leading bytes.
ImageFormat sniff_format(const std::vector<uint8_t>& bytes);

// Decode PNG/JPEG/BMP/TIFF bytes. Gray (and gray+alpha) stays single
// channel, colour becomes RGB; alpha is dropped. Throws DecodeError, or
// UploadTooLargeError when width*height exceeds max_pixels (0 = unlimited).
ImageBuffer decode_image(const std::vector<uint8_t>& bytes, long long max_pixels = 0);

// Encode with the inverse channel policy. PNG and TIFF keep 16-bit depth
// for 16-bit sources; everything else is written as 8-bit. Deterministic
// for a given buffer and options. Throws ProcessError (encode stage).
std::vector<uint8_t> encode_image(const ImageBuffer& image, const EncodeOptions& options = {});

} // namespace image_denoiser::io
