#include "image_denoiser/cdae/runtime.hpp"
#include "image_denoiser/core/errors.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

namespace image_denoiser::cdae {

std::vector<TileSpan> plan_tiles(int length, int tile, int overlap) {
    if (length <= tile) {
        return {TileSpan{0, 0, length}};
    }
    overlap = std::max(0, overlap);
    const int step = tile - 2 * overlap;
    if (step <= 0) {
        throw ProcessError(ProcessStage::INFERENCE,
                           "tile overlap " + std::to_string(overlap) + " leaves no interior in a " +
                               std::to_string(tile) + " pixel tile");
    }

    std::vector<int> starts;
    for (int s = 0; s + tile < length; s += step) {
        starts.push_back(s);
    }
    starts.push_back(length - tile);

    std::vector<TileSpan> spans;
    spans.reserve(starts.size());
    int prev_end = 0;
    for (size_t i = 0; i < starts.size(); ++i) {
        TileSpan span;
        span.start = starts[i];
        span.keep_begin = prev_end;
        span.keep_end = (i + 1 == starts.size()) ? length : starts[i] + tile - overlap;
        prev_end = span.keep_end;
        spans.push_back(span);
    }
    return spans;
}

namespace {

cv::Mat plane_to_mat(const Matrix2Df& plane) {
    return cv::Mat(static_cast<int>(plane.rows()), static_cast<int>(plane.cols()), CV_32F,
                   const_cast<float*>(plane.data()))
        .clone();
}

// Runs the session over planes of any size. Small inputs are padded up to
// one tile; larger ones are tiled with overlap and reassembled from tile
// interiors. Returns planes of the input size.
std::vector<cv::Mat> run_tiled(InferenceSession& session, const std::vector<cv::Mat>& planes,
                               int tile, int overlap, const core::Deadline& deadline) {
    const int h = planes[0].rows;
    const int w = planes[0].cols;
    const int ph = std::max(h, tile);
    const int pw = std::max(w, tile);
    const size_t n = planes.size();

    std::vector<cv::Mat> padded(n);
    std::vector<cv::Mat> assembled(n);
    for (size_t i = 0; i < n; ++i) {
        if (ph != h || pw != w) {
            cv::copyMakeBorder(planes[i], padded[i], 0, ph - h, 0, pw - w, cv::BORDER_REPLICATE);
        } else {
            padded[i] = planes[i];
        }
        assembled[i].create(ph, pw, CV_32F);
    }

    const std::vector<TileSpan> rows = plan_tiles(ph, tile, overlap);
    const std::vector<TileSpan> cols = plan_tiles(pw, tile, overlap);

    std::vector<cv::Mat> input(n);
    for (const auto& ry : rows) {
        for (const auto& rx : cols) {
            deadline.check("inference");

            const cv::Rect window(rx.start, ry.start, tile, tile);
            for (size_t i = 0; i < n; ++i) {
                input[i] = padded[i](window).clone();
            }

            const std::vector<cv::Mat> output = session.forward(input);
            if (output.size() != n) {
                throw ProcessError(ProcessStage::INFERENCE, "model returned " +
                                                                std::to_string(output.size()) +
                                                                " planes for " + std::to_string(n));
            }

            const int kw = rx.keep_end - rx.keep_begin;
            const int kh = ry.keep_end - ry.keep_begin;
            const cv::Rect from(rx.keep_begin - rx.start, ry.keep_begin - ry.start, kw, kh);
            const cv::Rect to(rx.keep_begin, ry.keep_begin, kw, kh);
            for (size_t i = 0; i < n; ++i) {
                if (output[i].rows != tile || output[i].cols != tile || output[i].type() != CV_32F) {
                    throw ProcessError(ProcessStage::INFERENCE, "model output tile has the wrong shape");
                }
                output[i](from).copyTo(assembled[i](to));
            }
        }
    }

    std::vector<cv::Mat> result(n);
    for (size_t i = 0; i < n; ++i) {
        result[i] = assembled[i](cv::Rect(0, 0, w, h)).clone();
    }
    return result;
}

} // namespace

ImageBuffer infer(const DenoisingModel& model, const ImageBuffer& image, float strength,
                  int tile_overlap, const core::Deadline& deadline) {
    if (!std::isfinite(strength) || strength < 0.0f || strength > 1.0f) {
        std::ostringstream oss;
        oss << "strength must be within [0,1], got " << strength;
        throw InvalidStrengthError(oss.str());
    }
    if (image.empty()) {
        throw ProcessError(ProcessStage::INFERENCE, "image buffer is empty");
    }
    if (strength == 0.0f) {
        return image;
    }

    const int tile = model.tile_size();
    // Native models declare their own tile size; keep a non-empty interior.
    const int overlap = std::min(std::max(0, tile_overlap), (tile - 1) / 2);
    std::vector<cv::Mat> planes;
    for (int c = 0; c < image.channels(); ++c) {
        planes.push_back(plane_to_mat(image.plane(c)));
    }

    std::vector<cv::Mat> denoised(planes.size());
    try {
        std::unique_ptr<InferenceSession> session = model.open_session();
        if (model.channels() == 1) {
            for (size_t c = 0; c < planes.size(); ++c) {
                denoised[c] = run_tiled(*session, {planes[c]}, tile, overlap, deadline)[0];
            }
        } else if (image.channels() == 3) {
            denoised = run_tiled(*session, planes, tile, overlap, deadline);
        } else {
            // Gray input through a colour model: replicate, then average back.
            const std::vector<cv::Mat> rgb =
                run_tiled(*session, {planes[0], planes[0], planes[0]}, tile, overlap, deadline);
            cv::Mat mean = (rgb[0] + rgb[1] + rgb[2]) / 3.0;
            denoised[0] = mean;
        }
    } catch (const cv::Exception& e) {
        throw ProcessError(ProcessStage::INFERENCE, e.msg);
    }

    ImageBuffer out(image.height(), image.width(), image.channels(), image.bit_depth());
    for (int c = 0; c < image.channels(); ++c) {
        const cv::Mat& d = denoised[static_cast<size_t>(c)];
        Eigen::Map<const Matrix2Df> den(d.ptr<float>(), d.rows, d.cols);
        out.plane(c) = (1.0f - strength) * image.plane(c) + strength * den;
    }
    out.clamp_unit();
    return out;
}

ModelHandle::ModelHandle(const config::ModelConfig& cfg, core::EventEmitter* emitter)
    : ModelHandle(cfg.path, [cfg]() { return load_model(cfg); }, emitter) {}

ModelHandle::ModelHandle(std::string source, Loader loader, core::EventEmitter* emitter)
    : source_(std::move(source)), loader_(std::move(loader)), emitter_(emitter) {}

const DenoisingModel& ModelHandle::acquire() {
    std::call_once(once_, [this]() { load_once(); });
    if (failure_) {
        std::rethrow_exception(failure_);
    }
    return *model_;
}

bool ModelHandle::preload() {
    try {
        acquire();
        return true;
    } catch (const ModelUnavailableError&) {
        return false;
    }
}

bool ModelHandle::available() const {
    return attempted_.load() && !failure_;
}

std::string ModelHandle::failure_message() const {
    return attempted_.load() ? failure_message_ : std::string();
}

void ModelHandle::load_once() {
    ++load_count_;
    const auto t0 = std::chrono::steady_clock::now();

    try {
        model_ = loader_();
        if (!model_) {
            throw ModelUnavailableError("loader returned no model for " + source_);
        }
    } catch (const ModelUnavailableError& e) {
        model_.reset();
        failure_ = std::current_exception();
        failure_message_ = e.what();
    } catch (const std::exception& e) {
        model_.reset();
        const ModelUnavailableError wrapped(e.what());
        failure_ = std::make_exception_ptr(wrapped);
        failure_message_ = wrapped.what();
    }

    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

    if (emitter_) {
        core::json extra = {{"elapsed_ms", elapsed_ms}};
        if (model_) {
            const ModelInfo mi = model_->info();
            extra["format"] = mi.format;
            extra["channels"] = mi.channels;
            extra["tile_size"] = mi.tile_size;
            extra["residual"] = mi.residual;
            extra["parameters"] = mi.parameters;
        }
        emitter_->model_load(source_, model_ != nullptr, model_ ? "loaded" : failure_message_, extra);
    }

    attempted_.store(true);
}

} // namespace image_denoiser::cdae
