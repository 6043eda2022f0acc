#include "image_denoiser/service/multipart.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/utils.hpp"

namespace image_denoiser::service {

namespace {

const std::string kCrlf = "\r\n";

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// "form-data; name=\"file\"; filename=\"a.png\"" -> {name: file, filename: a.png}
std::map<std::string, std::string> header_params(const std::string& value) {
    std::map<std::string, std::string> params;
    const auto fields = core::split(value, ';');
    for (size_t i = 1; i < fields.size(); ++i) {
        const std::string field = core::trim(fields[i]);
        const auto eq = field.find('=');
        if (eq == std::string::npos) continue;
        params[core::to_lower(core::trim(field.substr(0, eq)))] =
            unquote(core::trim(field.substr(eq + 1)));
    }
    return params;
}

} // namespace

std::optional<std::string> multipart_boundary(const std::string& content_type) {
    const auto fields = core::split(content_type, ';');
    if (fields.empty() || core::to_lower(core::trim(fields[0])) != "multipart/form-data") {
        return std::nullopt;
    }
    const auto params = header_params(content_type);
    auto it = params.find("boundary");
    if (it == params.end() || it->second.empty() || it->second.size() > 70) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MultipartPart> parse_multipart(const std::string& body, const std::string& boundary) {
    if (boundary.empty()) {
        throw InvalidUploadError("multipart boundary is empty");
    }
    const std::string delimiter = "--" + boundary;

    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) {
        throw InvalidUploadError("multipart body does not contain its boundary");
    }

    std::vector<MultipartPart> parts;
    while (true) {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0) {
            break;  // closing delimiter
        }
        if (body.compare(pos, 2, kCrlf) != 0) {
            throw InvalidUploadError("malformed multipart delimiter line");
        }
        pos += 2;

        const size_t header_end = body.find(kCrlf + kCrlf, pos);
        if (header_end == std::string::npos) {
            throw InvalidUploadError("multipart part headers are not terminated");
        }

        MultipartPart part;
        size_t line_start = pos;
        while (line_start < header_end) {
            size_t line_end = body.find(kCrlf, line_start);
            if (line_end == std::string::npos || line_end > header_end) line_end = header_end;
            const std::string line = body.substr(line_start, line_end - line_start);
            const auto colon = line.find(':');
            if (colon != std::string::npos) {
                part.headers[core::to_lower(core::trim(line.substr(0, colon)))] =
                    core::trim(line.substr(colon + 1));
            }
            line_start = line_end + 2;
        }

        auto disposition = part.headers.find("content-disposition");
        if (disposition == part.headers.end()) {
            throw InvalidUploadError("multipart part has no Content-Disposition header");
        }
        const auto params = header_params(disposition->second);
        auto name = params.find("name");
        if (name == params.end() || name->second.empty()) {
            throw InvalidUploadError("multipart part has no field name");
        }
        part.name = name->second;
        auto filename = params.find("filename");
        if (filename != params.end()) part.filename = filename->second;
        auto ctype = part.headers.find("content-type");
        if (ctype != part.headers.end()) part.content_type = ctype->second;

        const size_t data_start = header_end + 4;
        const size_t next = body.find(kCrlf + delimiter, data_start);
        if (next == std::string::npos) {
            throw InvalidUploadError("multipart part '" + part.name + "' is not terminated");
        }
        part.data = body.substr(data_start, next - data_start);
        parts.push_back(std::move(part));

        pos = next + 2;
    }
    return parts;
}

const MultipartPart* find_part(const std::vector<MultipartPart>& parts, const std::string& name) {
    for (const auto& p : parts) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

} // namespace image_denoiser::service
