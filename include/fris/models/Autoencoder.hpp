// =============================================================================
// Autoencoder.hpp - Frozen dense autoencoder (reconstruction scorer)
// =============================================================================
// FORMAT (autoencoder.json):
//   { "layers": [ {"weights":[[..]..], "bias":[..], "activation":"relu"|"linear"}, ... ],
//     "latent_layer": k }
//   weights are [out][in]. The last layer must output the input width.
// =============================================================================
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace fris {

enum class Activation : uint8_t {
    LINEAR = 0,
    RELU   = 1
};

struct DenseLayer {
    std::vector<std::vector<double>> weights;   // [out][in]
    std::vector<double> bias;
    Activation activation = Activation::LINEAR;

    size_t inputs() const { return weights.front().size(); }
    size_t outputs() const { return weights.size(); }

    std::vector<double> forward(const std::vector<double>& x) const;
};

struct Reconstruction {
    double error = 0.0;             // mean squared error over the input slice
    std::vector<double> latent;
};

class Autoencoder {
public:
    static Autoencoder fromJson(const nlohmann::json& j, const std::string& doc = "autoencoder");

    size_t numFeatures() const { return layers_.front().inputs(); }
    size_t latentWidth() const { return layers_[latent_layer_].outputs(); }

    Reconstruction reconstruct(const std::vector<double>& x) const;

private:
    std::vector<DenseLayer> layers_;
    size_t latent_layer_ = 0;
};

} // namespace fris
