#pragma once

#include "image_denoiser/cdae/model.hpp"
#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/deadline.hpp"
#include "image_denoiser/core/events.hpp"
#include "image_denoiser/core/types.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace image_denoiser::cdae {

// One tile position along an axis. The tile covers [start, start + tile)
// and contributes output pixels [keep_begin, keep_end).
struct TileSpan {
    int start = 0;
    int keep_begin = 0;
    int keep_end = 0;
};

// Tiles covering [0, length) with the given overlap. A length of at most one
// tile yields a single span; otherwise tile must exceed 2 * overlap. Kept
// ranges are contiguous and disjoint.
std::vector<TileSpan> plan_tiles(int length, int tile, int overlap);

// Denoise an image of any size with the model, blending the result with
// the input: out = (1 - strength) * input + strength * denoised.
// tile_overlap is capped below half the model's tile size.
// Throws InvalidStrengthError, TimeoutError or ProcessError (inference).
ImageBuffer infer(const DenoisingModel& model, const ImageBuffer& image, float strength,
                  int tile_overlap,
                  const core::Deadline& deadline = core::Deadline::none());

// Process-wide, lazily loaded model. The first acquire() runs the loader
// exactly once; concurrent callers wait for it. A failed load is kept and
// reported by every later acquire().
class ModelHandle {
public:
    using Loader = std::function<std::unique_ptr<DenoisingModel>()>;

    explicit ModelHandle(const config::ModelConfig& cfg, core::EventEmitter* emitter = nullptr);
    ModelHandle(std::string source, Loader loader, core::EventEmitter* emitter = nullptr);

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    // Throws ModelUnavailableError.
    const DenoisingModel& acquire();

    // Forces the load; true when the model is usable.
    bool preload();

    bool attempted() const { return attempted_.load(); }
    bool available() const;
    int load_count() const { return load_count_.load(); }
    const std::string& source() const { return source_; }

    // Message of the failed load, empty otherwise.
    std::string failure_message() const;

private:
    void load_once();

    std::string source_;
    Loader loader_;
    core::EventEmitter* emitter_;

    std::once_flag once_;
    std::unique_ptr<DenoisingModel> model_;
    std::exception_ptr failure_;
    std::string failure_message_;
    std::atomic<bool> attempted_{false};
    std::atomic<int> load_count_{0};
};

} // namespace image_denoiser::cdae
