#pragma once

#include "image_denoiser/config/configuration.hpp"
#include "image_denoiser/core/types.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace image_denoiser::cdae {

enum class LayerType {
    CONV,
    MAXPOOL,
    UPSAMPLE
};

enum class Activation {
    LINEAR,
    RELU,
    LEAKY_RELU,
    SIGMOID,
    TANH
};

std::string layer_type_to_string(LayerType type);
LayerType string_to_layer_type(const std::string& s);
std::string activation_to_string(Activation act);
Activation string_to_activation(const std::string& s);

struct Layer {
    LayerType type = LayerType::CONV;
    int in_channels = 0;
    int out_channels = 0;
    int kernel = 1;
    Activation activation = Activation::LINEAR;
    float negative_slope = 0.01f;  // leaky_relu only
    // kernels[o * in_channels + i] is the kernel x kernel CV_32F correlation
    // kernel from input channel i to output channel o.
    std::vector<cv::Mat> kernels;
    std::vector<float> bias;
};

struct ModelInfo {
    std::string format;
    std::string path;
    int channels = 1;
    int tile_size = 0;
    bool residual = false;
    int layers = 0;
    int pools = 0;
    long long parameters = 0;
};

// Per-call inference state. Not shared between threads.
class InferenceSession {
public:
    virtual ~InferenceSession() = default;

    // tile: channels() planes, each tile_size x tile_size CV_32F.
    // Returns the same number of planes with the same shape.
    virtual std::vector<cv::Mat> forward(const std::vector<cv::Mat>& tile) = 0;
};

// Loaded, immutable autoencoder weights.
class DenoisingModel {
public:
    virtual ~DenoisingModel() = default;

    virtual int channels() const = 0;
    virtual int tile_size() const = 0;
    virtual ModelInfo info() const = 0;

    virtual std::unique_ptr<InferenceSession> open_session() const = 0;
};

// Layer-list network read from an OpenCV FileStorage document
// (YAML, XML or JSON).
class ConvAutoencoder : public DenoisingModel {
public:
    static constexpr const char* kFormatTag = "image_denoiser_cdae";

    ConvAutoencoder(int channels, int tile_size, bool residual, std::vector<Layer> layers,
                    std::string source = "");

    static std::unique_ptr<ConvAutoencoder> load(const fs::path& path);

    // Writes the same document load() reads.
    void save(const fs::path& path) const;

    int channels() const override { return channels_; }
    int tile_size() const override { return tile_size_; }
    bool residual() const { return residual_; }
    const std::vector<Layer>& layers() const { return layers_; }
    ModelInfo info() const override;

    std::unique_ptr<InferenceSession> open_session() const override;

    // Runs the layer stack on one tile. Every intermediate is local to
    // the call.
    std::vector<cv::Mat> forward(const std::vector<cv::Mat>& tile) const;

private:
    void validate() const;

    int channels_;
    int tile_size_;
    bool residual_;
    std::vector<Layer> layers_;
    std::string source_;
};

// ONNX network executed with OpenCV DNN. Input and output are
// 1 x channels x tile_size x tile_size blobs.
class OnnxAutoencoder : public DenoisingModel {
    struct Token {
        explicit Token() = default;
    };

public:
    static std::unique_ptr<OnnxAutoencoder> load(const fs::path& path, int tile_size, int channels);

    // Only load() can name the token.
    OnnxAutoencoder(Token, std::vector<uchar> bytes, int tile_size, int channels, std::string source);

    int channels() const override { return channels_; }
    int tile_size() const override { return tile_size_; }
    ModelInfo info() const override;

    std::unique_ptr<InferenceSession> open_session() const override;

private:
    std::vector<uchar> bytes_;
    int tile_size_;
    int channels_;
    std::string source_;
};

// Pick the backend from model.format ("auto" goes by file extension) and
// load it. Every failure is reported as ModelUnavailableError.
std::unique_ptr<DenoisingModel> load_model(const config::ModelConfig& cfg);

} // namespace image_denoiser::cdae
