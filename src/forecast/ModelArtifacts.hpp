#pragma once

#include "forecast/Types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rainsight {
namespace forecast {

/**
 * Trained point predictor: one scaled feature row -> one scaled target value
 */
class IPredictor {
public:
    virtual ~IPredictor() = default;
    virtual size_t inputWidth() const = 0;
    virtual double predict(const std::vector<double>& features) const = 0;
};

/**
 * Column-wise feature scaler fitted at training time
 */
class IScaler {
public:
    virtual ~IScaler() = default;
    virtual size_t width() const = 0;
    virtual std::vector<double> transform(const std::vector<double>& row) const = 0;
    virtual std::vector<double> inverseTransform(const std::vector<double>& row) const = 0;
};

/**
 * x' = x * scale + min, with scale = (hi - lo) / (data_max - data_min)
 * Constant columns use scale 1.
 */
class MinMaxScaler : public IScaler {
public:
    MinMaxScaler(std::vector<double> dataMin, std::vector<double> dataMax,
                 double rangeMin = 0.0, double rangeMax = 1.0);

    size_t width() const override { return m_scale.size(); }
    std::vector<double> transform(const std::vector<double>& row) const override;
    std::vector<double> inverseTransform(const std::vector<double>& row) const override;

private:
    std::vector<double> m_scale;
    std::vector<double> m_min;
};

/**
 * x' = (x - mean) / scale. Zero scale is treated as 1.
 */
class StandardScaler : public IScaler {
public:
    StandardScaler(std::vector<double> mean, std::vector<double> scale);

    size_t width() const override { return m_mean.size(); }
    std::vector<double> transform(const std::vector<double>& row) const override;
    std::vector<double> inverseTransform(const std::vector<double>& row) const override;

private:
    std::vector<double> m_mean;
    std::vector<double> m_scale;
};

enum class Activation { Linear, Relu, Tanh, Sigmoid };

Activation activationFromString(const std::string& name);

struct DenseLayer {
    std::vector<std::vector<double>> weights;   // [in][out]
    std::vector<double> bias;                   // [out]
    Activation activation = Activation::Linear;

    size_t inputs() const { return weights.size(); }
    size_t outputs() const { return bias.size(); }
};

/**
 * Feed-forward network exported from the training notebook
 */
class DenseNetwork : public IPredictor {
public:
    /**
     * Throws ArtifactLoadError if the layer shapes do not chain or the
     * last layer does not produce a single value
     */
    explicit DenseNetwork(std::vector<DenseLayer> layers);

    size_t inputWidth() const override;
    double predict(const std::vector<double>& features) const override;

private:
    std::vector<DenseLayer> m_layers;
};

/**
 * Predictor + scaler pair for one mode, immutable once loaded
 */
struct ModelArtifacts {
    Mode mode = Mode::Daily;
    std::vector<std::string> features;
    std::shared_ptr<const IScaler> scaler;
    std::shared_ptr<const IPredictor> predictor;
};

/**
 * Loads exported artifact files
 *
 * Format:
 *   { "mode": "daily", "features": [...17 names...],
 *     "scaler": {"type": "minmax", "data_min": [...], "data_max": [...], "feature_range": [0, 1]},
 *     "model": {"type": "dense", "layers": [{"weights": [[...]], "bias": [...], "activation": "relu"}]} }
 *
 * Any inconsistency throws ArtifactLoadError.
 */
class ArtifactLoader {
public:
    static ModelArtifacts loadFile(const std::string& path, Mode expectedMode);
    static ModelArtifacts fromJson(const nlohmann::json& doc, Mode expectedMode);
};

/**
 * Artifacts per mode, shared read-only by all sessions
 */
class ArtifactRegistry {
public:
    void add(ModelArtifacts artifacts);
    bool has(Mode mode) const;

    /**
     * Throws ArtifactLoadError if nothing was loaded for this mode
     */
    const ModelArtifacts& get(Mode mode) const;

private:
    std::map<Mode, ModelArtifacts> m_artifacts;
};

} // namespace forecast
} // namespace rainsight
