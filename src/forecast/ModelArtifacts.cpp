#include "forecast/ModelArtifacts.hpp"
#include "forecast/FeatureEngineer.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <cmath>
#include <fstream>

namespace rainsight {
namespace forecast {

namespace {

void requireWidth(const std::vector<double>& row, size_t width, const char* what) {
    if (row.size() != width) {
        throw ValidationError(std::string(what) + ": row has " + std::to_string(row.size()) +
                              " values, scaler expects " + std::to_string(width));
    }
}

double activate(Activation activation, double x) {
    switch (activation) {
        case Activation::Relu: return x > 0.0 ? x : 0.0;
        case Activation::Tanh: return std::tanh(x);
        case Activation::Sigmoid: return 1.0 / (1.0 + std::exp(-x));
        case Activation::Linear:
        default: return x;
    }
}

std::vector<double> readVector(const nlohmann::json& node, const std::string& key) {
    if (!node.contains(key) || !node[key].is_array()) {
        throw ArtifactLoadError("Missing array '" + key + "'");
    }
    return node[key].get<std::vector<double>>();
}

std::shared_ptr<const IScaler> parseScaler(const nlohmann::json& node) {
    std::string type = node.value("type", "");
    if (type == "minmax") {
        double lo = 0.0;
        double hi = 1.0;
        if (node.contains("feature_range")) {
            auto range = node["feature_range"].get<std::vector<double>>();
            if (range.size() != 2) {
                throw ArtifactLoadError("feature_range must have two values");
            }
            lo = range[0];
            hi = range[1];
        }
        return std::make_shared<MinMaxScaler>(readVector(node, "data_min"),
                                              readVector(node, "data_max"), lo, hi);
    }
    if (type == "standard") {
        return std::make_shared<StandardScaler>(readVector(node, "mean"), readVector(node, "scale"));
    }
    throw ArtifactLoadError("Unknown scaler type: '" + type + "'");
}

std::shared_ptr<const IPredictor> parseModel(const nlohmann::json& node) {
    std::string type = node.value("type", "");
    if (type != "dense") {
        throw ArtifactLoadError("Unknown model type: '" + type + "'");
    }
    if (!node.contains("layers") || !node["layers"].is_array() || node["layers"].empty()) {
        throw ArtifactLoadError("Model has no layers");
    }

    std::vector<DenseLayer> layers;
    for (const auto& layerNode : node["layers"]) {
        DenseLayer layer;
        layer.weights = layerNode.at("weights").get<std::vector<std::vector<double>>>();
        layer.bias = layerNode.at("bias").get<std::vector<double>>();
        layer.activation = activationFromString(layerNode.value("activation", "linear"));
        layers.push_back(std::move(layer));
    }
    return std::make_shared<DenseNetwork>(std::move(layers));
}

} // anonymous namespace

// =============================================================================
// Scalers
// =============================================================================

MinMaxScaler::MinMaxScaler(std::vector<double> dataMin, std::vector<double> dataMax,
                           double rangeMin, double rangeMax) {
    if (dataMin.size() != dataMax.size() || dataMin.empty()) {
        throw ArtifactLoadError("MinMax scaler: data_min and data_max must be non-empty and of equal size");
    }
    if (!(rangeMax > rangeMin)) {
        throw ArtifactLoadError("MinMax scaler: invalid feature_range");
    }

    m_scale.resize(dataMin.size());
    m_min.resize(dataMin.size());
    for (size_t i = 0; i < dataMin.size(); ++i) {
        double range = dataMax[i] - dataMin[i];
        if (range == 0.0) range = 1.0;
        m_scale[i] = (rangeMax - rangeMin) / range;
        m_min[i] = rangeMin - dataMin[i] * m_scale[i];
    }
}

std::vector<double> MinMaxScaler::transform(const std::vector<double>& row) const {
    requireWidth(row, width(), "MinMax transform");
    std::vector<double> out(row.size());
    for (size_t i = 0; i < row.size(); ++i) {
        out[i] = row[i] * m_scale[i] + m_min[i];
    }
    return out;
}

std::vector<double> MinMaxScaler::inverseTransform(const std::vector<double>& row) const {
    requireWidth(row, width(), "MinMax inverse");
    std::vector<double> out(row.size());
    for (size_t i = 0; i < row.size(); ++i) {
        out[i] = (row[i] - m_min[i]) / m_scale[i];
    }
    return out;
}

StandardScaler::StandardScaler(std::vector<double> mean, std::vector<double> scale)
    : m_mean(std::move(mean))
    , m_scale(std::move(scale))
{
    if (m_mean.size() != m_scale.size() || m_mean.empty()) {
        throw ArtifactLoadError("Standard scaler: mean and scale must be non-empty and of equal size");
    }
    for (auto& s : m_scale) {
        if (s == 0.0) s = 1.0;
    }
}

std::vector<double> StandardScaler::transform(const std::vector<double>& row) const {
    requireWidth(row, width(), "Standard transform");
    std::vector<double> out(row.size());
    for (size_t i = 0; i < row.size(); ++i) {
        out[i] = (row[i] - m_mean[i]) / m_scale[i];
    }
    return out;
}

std::vector<double> StandardScaler::inverseTransform(const std::vector<double>& row) const {
    requireWidth(row, width(), "Standard inverse");
    std::vector<double> out(row.size());
    for (size_t i = 0; i < row.size(); ++i) {
        out[i] = row[i] * m_scale[i] + m_mean[i];
    }
    return out;
}

// =============================================================================
// DenseNetwork
// =============================================================================

Activation activationFromString(const std::string& name) {
    if (name == "linear" || name.empty()) return Activation::Linear;
    if (name == "relu") return Activation::Relu;
    if (name == "tanh") return Activation::Tanh;
    if (name == "sigmoid") return Activation::Sigmoid;
    throw ArtifactLoadError("Unknown activation: '" + name + "'");
}

DenseNetwork::DenseNetwork(std::vector<DenseLayer> layers)
    : m_layers(std::move(layers))
{
    if (m_layers.empty()) {
        throw ArtifactLoadError("Dense network has no layers");
    }

    for (size_t l = 0; l < m_layers.size(); ++l) {
        const auto& layer = m_layers[l];
        if (layer.inputs() == 0 || layer.outputs() == 0) {
            throw ArtifactLoadError("Layer " + std::to_string(l) + " is empty");
        }
        for (const auto& row : layer.weights) {
            if (row.size() != layer.outputs()) {
                throw ArtifactLoadError("Layer " + std::to_string(l) +
                                        ": weight rows must match bias size");
            }
        }
        if (l > 0 && m_layers[l - 1].outputs() != layer.inputs()) {
            throw ArtifactLoadError("Layer " + std::to_string(l) + " expects " +
                                    std::to_string(layer.inputs()) + " inputs, previous layer produces " +
                                    std::to_string(m_layers[l - 1].outputs()));
        }
    }

    if (m_layers.back().outputs() != 1) {
        throw ArtifactLoadError("Dense network must produce a single output");
    }
}

size_t DenseNetwork::inputWidth() const {
    return m_layers.front().inputs();
}

double DenseNetwork::predict(const std::vector<double>& features) const {
    if (features.size() != inputWidth()) {
        throw ValidationError("Predictor expects " + std::to_string(inputWidth()) +
                              " features, got " + std::to_string(features.size()));
    }

    std::vector<double> current = features;
    for (const auto& layer : m_layers) {
        std::vector<double> next = layer.bias;
        for (size_t i = 0; i < layer.inputs(); ++i) {
            const auto& w = layer.weights[i];
            for (size_t j = 0; j < layer.outputs(); ++j) {
                next[j] += current[i] * w[j];
            }
        }
        for (auto& v : next) {
            v = activate(layer.activation, v);
        }
        current = std::move(next);
    }
    return current.front();
}

// =============================================================================
// ArtifactLoader
// =============================================================================

ModelArtifacts ArtifactLoader::loadFile(const std::string& path, Mode expectedMode) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ArtifactLoadError("Cannot open artifact file: " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw ArtifactLoadError("Invalid JSON in " + path + ": " + e.what());
    }

    ModelArtifacts artifacts = fromJson(doc, expectedMode);
    LOG_INFO("Loaded " + modeToString(expectedMode) + " artifacts from " + path);
    return artifacts;
}

ModelArtifacts ArtifactLoader::fromJson(const nlohmann::json& doc, Mode expectedMode) {
    ModelArtifacts artifacts;
    try {
        if (!doc.is_object()) {
            throw ArtifactLoadError("Artifact document must be an object");
        }

        std::string mode = doc.value("mode", "");
        if (mode != modeToString(expectedMode)) {
            throw ArtifactLoadError("Artifact mode '" + mode + "' does not match '" +
                                    modeToString(expectedMode) + "'");
        }
        artifacts.mode = expectedMode;

        artifacts.features = doc.at("features").get<std::vector<std::string>>();
        if (artifacts.features != FeatureEngineer::featureNames()) {
            throw ArtifactLoadError("Artifact feature list does not match the feature window columns");
        }

        artifacts.scaler = parseScaler(doc.at("scaler"));
        artifacts.predictor = parseModel(doc.at("model"));
    } catch (const nlohmann::json::exception& e) {
        throw ArtifactLoadError(std::string("Malformed artifact: ") + e.what());
    }

    if (artifacts.scaler->width() != artifacts.features.size()) {
        throw ArtifactLoadError("Scaler width " + std::to_string(artifacts.scaler->width()) +
                                " does not match " + std::to_string(artifacts.features.size()) + " features");
    }
    if (artifacts.predictor->inputWidth() != artifacts.features.size()) {
        throw ArtifactLoadError("Model input width " + std::to_string(artifacts.predictor->inputWidth()) +
                                " does not match " + std::to_string(artifacts.features.size()) + " features");
    }
    return artifacts;
}

// =============================================================================
// ArtifactRegistry
// =============================================================================

void ArtifactRegistry::add(ModelArtifacts artifacts) {
    Mode mode = artifacts.mode;
    m_artifacts[mode] = std::move(artifacts);
}

bool ArtifactRegistry::has(Mode mode) const {
    return m_artifacts.count(mode) > 0;
}

const ModelArtifacts& ArtifactRegistry::get(Mode mode) const {
    auto it = m_artifacts.find(mode);
    if (it == m_artifacts.end()) {
        throw ArtifactLoadError("No model artifacts loaded for " + modeToString(mode) + " forecasts");
    }
    return it->second;
}

} // namespace forecast
} // namespace rainsight
