#include "fris/models/Autoencoder.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/core/Errors.hpp"

#include <cmath>

using json = nlohmann::json;

namespace fris {

namespace {
const char* MODEL_NAME = "autoencoder";
} // namespace

std::vector<double> DenseLayer::forward(const std::vector<double>& x) const {
    std::vector<double> out(outputs());
    for (size_t o = 0; o < outputs(); ++o) {
        double s = bias[o];
        const auto& w = weights[o];
        for (size_t i = 0; i < x.size(); ++i) s += w[i] * x[i];
        out[o] = (activation == Activation::RELU && s < 0.0) ? 0.0 : s;
    }
    return out;
}

Autoencoder Autoencoder::fromJson(const json& j, const std::string& doc) {
    Autoencoder model;

    const json& layers = ModelJson::member(j, "layers", doc);
    if (!layers.is_array() || layers.empty()) {
        throw ArtifactError(doc + ": 'layers' must be a non-empty array");
    }

    for (size_t l = 0; l < layers.size(); ++l) {
        const std::string at = doc + ":layers[" + std::to_string(l) + "]";
        DenseLayer layer;
        layer.weights = ModelJson::matrix(layers[l], "weights", at);
        layer.bias = ModelJson::vector(layers[l], "bias", at);
        if (layer.bias.size() != layer.outputs()) {
            throw ArtifactError(at + ": bias width does not match weights");
        }

        const json& aj = ModelJson::member(layers[l], "activation", at);
        const std::string act = aj.is_string() ? aj.get<std::string>() : std::string();
        if (act == "relu") {
            layer.activation = Activation::RELU;
        } else if (act == "linear") {
            layer.activation = Activation::LINEAR;
        } else {
            throw ArtifactError(at + ": unknown activation '" + act + "'");
        }

        if (!model.layers_.empty() && layer.inputs() != model.layers_.back().outputs()) {
            throw ArtifactError(at + ": input width does not match previous layer output");
        }
        model.layers_.push_back(std::move(layer));
    }

    if (model.layers_.back().outputs() != model.layers_.front().inputs()) {
        throw ArtifactError(doc + ": output width must equal input width");
    }

    const int latent = ModelJson::integer(j, "latent_layer", doc);
    if (latent < 0 || static_cast<size_t>(latent) >= model.layers_.size()) {
        throw ArtifactError(doc + ": latent_layer out of range");
    }
    model.latent_layer_ = static_cast<size_t>(latent);
    return model;
}

Reconstruction Autoencoder::reconstruct(const std::vector<double>& x) const {
    if (x.size() != numFeatures()) {
        throw ModelError(MODEL_NAME, "expected " + std::to_string(numFeatures()) +
                         " features, got " + std::to_string(x.size()));
    }

    Reconstruction r;
    std::vector<double> h = x;
    for (size_t l = 0; l < layers_.size(); ++l) {
        h = layers_[l].forward(h);
        if (l == latent_layer_) r.latent = h;
    }

    double sse = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double d = h[i] - x[i];
        sse += d * d;
    }
    r.error = sse / static_cast<double>(x.size());
    if (!std::isfinite(r.error)) {
        throw ModelError(MODEL_NAME, "reconstruction error is not finite");
    }
    return r;
}

} // namespace fris
