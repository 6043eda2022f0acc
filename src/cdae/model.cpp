#include "image_denoiser/cdae/model.hpp"
#include "image_denoiser/core/errors.hpp"
#include "image_denoiser/core/utils.hpp"

#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace image_denoiser::cdae {

std::string layer_type_to_string(LayerType type) {
    switch (type) {
        case LayerType::CONV: return "conv";
        case LayerType::MAXPOOL: return "maxpool";
        case LayerType::UPSAMPLE: return "upsample";
        default: return "unknown";
    }
}

LayerType string_to_layer_type(const std::string& s) {
    const std::string t = core::to_lower(s);
    if (t == "conv") return LayerType::CONV;
    if (t == "maxpool") return LayerType::MAXPOOL;
    if (t == "upsample") return LayerType::UPSAMPLE;
    throw ModelUnavailableError("unknown layer type '" + s + "'");
}

std::string activation_to_string(Activation act) {
    switch (act) {
        case Activation::LINEAR: return "linear";
        case Activation::RELU: return "relu";
        case Activation::LEAKY_RELU: return "leaky_relu";
        case Activation::SIGMOID: return "sigmoid";
        case Activation::TANH: return "tanh";
        default: return "unknown";
    }
}

Activation string_to_activation(const std::string& s) {
    const std::string t = core::to_lower(s);
    if (t.empty() || t == "linear") return Activation::LINEAR;
    if (t == "relu") return Activation::RELU;
    if (t == "leaky_relu") return Activation::LEAKY_RELU;
    if (t == "sigmoid") return Activation::SIGMOID;
    if (t == "tanh") return Activation::TANH;
    throw ModelUnavailableError("unknown activation '" + s + "'");
}

namespace {

int require_int(const cv::FileNode& node, const std::string& key, const std::string& where) {
    const cv::FileNode n = node[key];
    if (n.empty() || !n.isInt()) {
        throw ModelUnavailableError(where + ": missing integer field '" + key + "'");
    }
    return static_cast<int>(n);
}

void apply_activation(cv::Mat& m, const Layer& layer) {
    if (layer.activation == Activation::LINEAR) return;
    for (int y = 0; y < m.rows; ++y) {
        float* row = m.ptr<float>(y);
        for (int x = 0; x < m.cols; ++x) {
            float& v = row[x];
            switch (layer.activation) {
                case Activation::RELU:
                    v = std::max(v, 0.0f);
                    break;
                case Activation::LEAKY_RELU:
                    if (v < 0.0f) v *= layer.negative_slope;
                    break;
                case Activation::SIGMOID:
                    v = 1.0f / (1.0f + std::exp(-v));
                    break;
                case Activation::TANH:
                    v = std::tanh(v);
                    break;
                default:
                    break;
            }
        }
    }
}

std::vector<cv::Mat> conv_forward(const Layer& layer, const std::vector<cv::Mat>& in) {
    std::vector<cv::Mat> out;
    out.reserve(static_cast<size_t>(layer.out_channels));
    cv::Mat response;
    for (int o = 0; o < layer.out_channels; ++o) {
        cv::Mat acc(in[0].rows, in[0].cols, CV_32F, cv::Scalar(layer.bias[static_cast<size_t>(o)]));
        for (int i = 0; i < layer.in_channels; ++i) {
            const cv::Mat& k = layer.kernels[static_cast<size_t>(o * layer.in_channels + i)];
            // Zero padding keeps the spatial size ("same" convolution).
            cv::filter2D(in[static_cast<size_t>(i)], response, CV_32F, k, cv::Point(-1, -1), 0.0,
                         cv::BORDER_CONSTANT);
            acc += response;
        }
        apply_activation(acc, layer);
        out.push_back(acc);
    }
    return out;
}

cv::Mat max_pool2(const cv::Mat& m) {
    cv::Mat out(m.rows / 2, m.cols / 2, CV_32F);
    for (int y = 0; y < out.rows; ++y) {
        const float* r0 = m.ptr<float>(2 * y);
        const float* r1 = m.ptr<float>(2 * y + 1);
        float* dst = out.ptr<float>(y);
        for (int x = 0; x < out.cols; ++x) {
            dst[x] = std::max(std::max(r0[2 * x], r0[2 * x + 1]), std::max(r1[2 * x], r1[2 * x + 1]));
        }
    }
    return out;
}

cv::Mat upsample2(const cv::Mat& m) {
    cv::Mat out;
    cv::resize(m, out, cv::Size(m.cols * 2, m.rows * 2), 0.0, 0.0, cv::INTER_NEAREST);
    return out;
}

class NativeSession : public InferenceSession {
public:
    explicit NativeSession(const ConvAutoencoder& model) : model_(model) {}

    std::vector<cv::Mat> forward(const std::vector<cv::Mat>& tile) override {
        return model_.forward(tile);
    }

private:
    const ConvAutoencoder& model_;
};

class OnnxSession : public InferenceSession {
public:
    OnnxSession(cv::dnn::Net net, int tile_size, int channels)
        : net_(std::move(net)), tile_size_(tile_size), channels_(channels) {}

    std::vector<cv::Mat> forward(const std::vector<cv::Mat>& tile) override {
        if (static_cast<int>(tile.size()) != channels_) {
            throw ProcessError(ProcessStage::INFERENCE, "tile channel count does not match the model");
        }
        cv::Mat out;
        try {
            cv::Mat merged;
            if (channels_ == 1) {
                merged = tile[0];
            } else {
                cv::merge(tile, merged);
            }
            net_.setInput(cv::dnn::blobFromImage(merged));
            out = net_.forward();
        } catch (const cv::Exception& e) {
            throw ProcessError(ProcessStage::INFERENCE, "ONNX forward failed: " + e.msg);
        }

        if (out.dims != 4 || out.size[0] != 1 || out.size[1] != channels_ ||
            out.size[2] != tile_size_ || out.size[3] != tile_size_) {
            throw ProcessError(ProcessStage::INFERENCE,
                               "ONNX output is not 1x" + std::to_string(channels_) + "x" +
                                   std::to_string(tile_size_) + "x" + std::to_string(tile_size_));
        }

        std::vector<cv::Mat> planes;
        planes.reserve(static_cast<size_t>(channels_));
        for (int c = 0; c < channels_; ++c) {
            planes.push_back(cv::Mat(tile_size_, tile_size_, CV_32F, out.ptr<float>(0, c)).clone());
        }
        return planes;
    }

private:
    cv::dnn::Net net_;
    int tile_size_;
    int channels_;
};

} // namespace

ConvAutoencoder::ConvAutoencoder(int channels, int tile_size, bool residual, std::vector<Layer> layers,
                                 std::string source)
    : channels_(channels), tile_size_(tile_size), residual_(residual), layers_(std::move(layers)),
      source_(std::move(source)) {
    validate();
}

void ConvAutoencoder::validate() const {
    if (channels_ != 1 && channels_ != 3) {
        throw ModelUnavailableError("model channels must be 1 or 3, got " + std::to_string(channels_));
    }
    if (tile_size_ <= 0) {
        throw ModelUnavailableError("model tile_size must be > 0");
    }
    if (layers_.empty()) {
        throw ModelUnavailableError("model has no layers");
    }

    int current = channels_;
    int pools = 0;
    int upsamples = 0;
    for (size_t idx = 0; idx < layers_.size(); ++idx) {
        const Layer& l = layers_[idx];
        const std::string where = "layer " + std::to_string(idx);
        switch (l.type) {
            case LayerType::CONV: {
                if (l.in_channels != current) {
                    throw ModelUnavailableError(where + " expects " + std::to_string(l.in_channels) +
                                                " input channels, previous layer yields " +
                                                std::to_string(current));
                }
                if (l.out_channels <= 0) {
                    throw ModelUnavailableError(where + " has no output channels");
                }
                if (l.kernel <= 0 || l.kernel % 2 == 0) {
                    throw ModelUnavailableError(where + " kernel size must be odd");
                }
                if (l.kernels.size() != static_cast<size_t>(l.in_channels * l.out_channels)) {
                    throw ModelUnavailableError(where + " weight count does not match in*out");
                }
                for (const auto& k : l.kernels) {
                    if (k.rows != l.kernel || k.cols != l.kernel || k.type() != CV_32F) {
                        throw ModelUnavailableError(where + " kernel shape mismatch");
                    }
                }
                if (l.bias.size() != static_cast<size_t>(l.out_channels)) {
                    throw ModelUnavailableError(where + " bias length does not match out channels");
                }
                current = l.out_channels;
                break;
            }
            case LayerType::MAXPOOL:
                ++pools;
                break;
            case LayerType::UPSAMPLE:
                ++upsamples;
                if (upsamples > pools) {
                    throw ModelUnavailableError(where + " upsamples beyond input resolution");
                }
                break;
        }
    }

    if (pools != upsamples) {
        throw ModelUnavailableError("maxpool and upsample layer counts differ (" +
                                    std::to_string(pools) + " vs " + std::to_string(upsamples) + ")");
    }
    if (tile_size_ % (1 << pools) != 0) {
        throw ModelUnavailableError("tile_size " + std::to_string(tile_size_) +
                                    " is not divisible by 2^" + std::to_string(pools));
    }
    if (current != channels_) {
        throw ModelUnavailableError("output channels (" + std::to_string(current) +
                                    ") differ from input channels (" + std::to_string(channels_) + ")");
    }
}

std::unique_ptr<ConvAutoencoder> ConvAutoencoder::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ModelUnavailableError("weights file not found: " + path.string());
    }

    try {
        cv::FileStorage store(path.string(), cv::FileStorage::READ);
        if (!store.isOpened()) {
            throw ModelUnavailableError("cannot open weights file " + path.string());
        }

        const std::string where = path.filename().string();
        const std::string tag = static_cast<std::string>(store["format"]);
        if (tag != kFormatTag) {
            throw ModelUnavailableError(where + " is not a " + std::string(kFormatTag) + " document");
        }

        const cv::FileNode root = store.root();
        const int channels = require_int(root, "channels", where);
        const int tile_size = require_int(root, "tile_size", where);
        const bool residual = !store["residual"].empty() && static_cast<int>(store["residual"]) != 0;

        const cv::FileNode layer_nodes = store["layers"];
        if (layer_nodes.empty() || !layer_nodes.isSeq()) {
            throw ModelUnavailableError(where + ": 'layers' must be a sequence");
        }

        std::vector<Layer> layers;
        int idx = 0;
        for (auto it = layer_nodes.begin(); it != layer_nodes.end(); ++it, ++idx) {
            const cv::FileNode n = *it;
            const std::string lw = where + " layer " + std::to_string(idx);
            Layer l;
            l.type = string_to_layer_type(static_cast<std::string>(n["type"]));
            if (l.type == LayerType::CONV) {
                l.in_channels = require_int(n, "in", lw);
                l.out_channels = require_int(n, "out", lw);
                l.kernel = require_int(n, "kernel", lw);
                l.activation = string_to_activation(static_cast<std::string>(n["activation"]));
                if (!n["negative_slope"].empty()) {
                    l.negative_slope = static_cast<float>(n["negative_slope"]);
                }

                cv::Mat weights;
                n["weights"] >> weights;
                if (weights.empty()) {
                    throw ModelUnavailableError(lw + ": missing weights");
                }
                weights.convertTo(weights, CV_32F);
                const int expected_rows = l.in_channels * l.out_channels;
                if (weights.rows != expected_rows || weights.cols != l.kernel * l.kernel) {
                    throw ModelUnavailableError(lw + ": weights must be " + std::to_string(expected_rows) +
                                                "x" + std::to_string(l.kernel * l.kernel));
                }
                for (int r = 0; r < weights.rows; ++r) {
                    l.kernels.push_back(weights.row(r).clone().reshape(1, l.kernel));
                }

                n["bias"] >> l.bias;
            }
            layers.push_back(std::move(l));
        }

        return std::make_unique<ConvAutoencoder>(channels, tile_size, residual, std::move(layers),
                                                 path.string());
    } catch (const cv::Exception& e) {
        throw ModelUnavailableError("weights file " + path.string() + " is malformed (" + e.msg + ")");
    }
}

void ConvAutoencoder::save(const fs::path& path) const {
    cv::FileStorage store(path.string(), cv::FileStorage::WRITE);
    if (!store.isOpened()) {
        throw IOError("Cannot write model file: " + path.string());
    }

    store << "format" << std::string(kFormatTag);
    store << "version" << 1;
    store << "channels" << channels_;
    store << "tile_size" << tile_size_;
    store << "residual" << (residual_ ? 1 : 0);
    store << "layers" << "[";
    for (const auto& l : layers_) {
        store << "{";
        store << "type" << layer_type_to_string(l.type);
        if (l.type == LayerType::CONV) {
            store << "in" << l.in_channels;
            store << "out" << l.out_channels;
            store << "kernel" << l.kernel;
            store << "activation" << activation_to_string(l.activation);
            if (l.activation == Activation::LEAKY_RELU) {
                store << "negative_slope" << l.negative_slope;
            }
            cv::Mat weights(static_cast<int>(l.kernels.size()), l.kernel * l.kernel, CV_32F);
            for (size_t r = 0; r < l.kernels.size(); ++r) {
                l.kernels[r].clone().reshape(1, 1).copyTo(weights.row(static_cast<int>(r)));
            }
            store << "weights" << weights;
            store << "bias" << l.bias;
        }
        store << "}";
    }
    store << "]";
    store.release();
}

ModelInfo ConvAutoencoder::info() const {
    ModelInfo mi;
    mi.format = "native";
    mi.path = source_;
    mi.channels = channels_;
    mi.tile_size = tile_size_;
    mi.residual = residual_;
    mi.layers = static_cast<int>(layers_.size());
    for (const auto& l : layers_) {
        if (l.type == LayerType::MAXPOOL) ++mi.pools;
        if (l.type == LayerType::CONV) {
            mi.parameters += static_cast<long long>(l.kernels.size()) * l.kernel * l.kernel +
                             static_cast<long long>(l.bias.size());
        }
    }
    return mi;
}

std::unique_ptr<InferenceSession> ConvAutoencoder::open_session() const {
    return std::make_unique<NativeSession>(*this);
}

std::vector<cv::Mat> ConvAutoencoder::forward(const std::vector<cv::Mat>& tile) const {
    if (static_cast<int>(tile.size()) != channels_) {
        throw ProcessError(ProcessStage::INFERENCE, "tile has " + std::to_string(tile.size()) +
                                                        " planes, model expects " +
                                                        std::to_string(channels_));
    }
    for (const auto& p : tile) {
        if (p.rows != tile_size_ || p.cols != tile_size_ || p.type() != CV_32F) {
            throw ProcessError(ProcessStage::INFERENCE, "tile is not " + std::to_string(tile_size_) +
                                                            "x" + std::to_string(tile_size_) + " float");
        }
    }

    std::vector<cv::Mat> x = tile;
    for (const auto& layer : layers_) {
        switch (layer.type) {
            case LayerType::CONV:
                x = conv_forward(layer, x);
                break;
            case LayerType::MAXPOOL:
                for (auto& m : x) m = max_pool2(m);
                break;
            case LayerType::UPSAMPLE:
                for (auto& m : x) m = upsample2(m);
                break;
        }
    }

    if (residual_) {
        for (size_t c = 0; c < x.size(); ++c) {
            x[c] = tile[c] - x[c];
        }
    }
    return x;
}

OnnxAutoencoder::OnnxAutoencoder(Token, std::vector<uchar> bytes, int tile_size, int channels,
                                 std::string source)
    : bytes_(std::move(bytes)), tile_size_(tile_size), channels_(channels), source_(std::move(source)) {}

std::unique_ptr<OnnxAutoencoder> OnnxAutoencoder::load(const fs::path& path, int tile_size,
                                                       int channels) {
    if (channels != 1 && channels != 3) {
        throw ModelUnavailableError("ONNX model channels must be 1 or 3");
    }
    if (tile_size <= 0) {
        throw ModelUnavailableError("ONNX model tile size must be > 0");
    }
    if (!fs::exists(path)) {
        throw ModelUnavailableError("weights file not found: " + path.string());
    }

    std::vector<uchar> bytes;
    try {
        bytes = core::read_bytes(path);
    } catch (const IOError& e) {
        throw ModelUnavailableError(e.what());
    }

    auto model = std::make_unique<OnnxAutoencoder>(Token{}, std::move(bytes), tile_size, channels,
                                                   path.string());

    // Run one zero tile so a broken graph fails at load instead of per request.
    try {
        auto session = model->open_session();
        std::vector<cv::Mat> zeros(static_cast<size_t>(channels),
                                   cv::Mat::zeros(tile_size, tile_size, CV_32F));
        session->forward(zeros);
    } catch (const ProcessError& e) {
        throw ModelUnavailableError(path.filename().string() + ": " + e.what());
    }
    return model;
}

ModelInfo OnnxAutoencoder::info() const {
    ModelInfo mi;
    mi.format = "onnx";
    mi.path = source_;
    mi.channels = channels_;
    mi.tile_size = tile_size_;
    return mi;
}

std::unique_ptr<InferenceSession> OnnxAutoencoder::open_session() const {
    cv::dnn::Net net;
    try {
        net = cv::dnn::readNetFromONNX(bytes_);
    } catch (const cv::Exception& e) {
        throw ProcessError(ProcessStage::INFERENCE, "cannot parse ONNX graph: " + e.msg);
    }
    if (net.empty()) {
        throw ProcessError(ProcessStage::INFERENCE, "ONNX graph is empty");
    }
    return std::make_unique<OnnxSession>(std::move(net), tile_size_, channels_);
}

std::unique_ptr<DenoisingModel> load_model(const config::ModelConfig& cfg) {
    if (cfg.path.empty()) {
        throw ModelUnavailableError("no model path configured");
    }
    const fs::path path(cfg.path);

    std::string format = core::to_lower(cfg.format);
    if (format == "auto") {
        format = core::to_lower(path.extension().string()) == ".onnx" ? "onnx" : "native";
    }

    if (format == "onnx") {
        return OnnxAutoencoder::load(path, cfg.onnx_tile_size, cfg.onnx_channels);
    }
    if (format == "native") {
        return ConvAutoencoder::load(path);
    }
    throw ModelUnavailableError("unknown model format '" + cfg.format + "'");
}

} // namespace image_denoiser::cdae
