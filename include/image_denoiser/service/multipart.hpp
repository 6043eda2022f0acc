#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace image_denoiser::service {

struct MultipartPart {
    std::string name;
    std::string filename;
    std::string content_type;
    std::map<std::string, std::string> headers;  // lower-case names
    std::string data;
};

// Boundary parameter of a multipart/form-data Content-Type header, or
// nullopt when the header names another media type.
std::optional<std::string> multipart_boundary(const std::string& content_type);

// Split a multipart/form-data body (RFC 7578). Throws InvalidUploadError
// on a malformed body.
std::vector<MultipartPart> parse_multipart(const std::string& body, const std::string& boundary);

// First part with the given field name, nullptr if absent.
const MultipartPart* find_part(const std::vector<MultipartPart>& parts, const std::string& name);

} // namespace image_denoiser::service
