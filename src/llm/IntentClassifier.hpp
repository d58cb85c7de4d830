#pragma once

#include "forecast/Types.hpp"
#include "llm/LanguageModel.hpp"
#include <memory>
#include <string>

namespace rainsight {
namespace llm {

struct ClassifierOptions {
    double latitude = 6.585;
    double longitude = 3.983;
    int maxDailyHorizon = 16;
    int maxMonthlyHorizon = 12;
};

/**
 * Turns a free-text rainfall question into an Intent
 *
 * The language model is asked for {"mode", "horizon", "confidence",
 * "explanation"}. Whenever it is missing, fails or answers something
 * unusable, the keyword rule decides ("month" -> monthly, else daily).
 */
class IntentClassifier {
public:
    static constexpr double kFallbackConfidence = 0.3;
    static constexpr int kDefaultDailyHorizon = 7;
    static constexpr int kDefaultMonthlyHorizon = 3;

    IntentClassifier(std::shared_ptr<ILanguageModel> model, ClassifierOptions options = {});

    /**
     * Throws ValidationError on an empty query
     */
    forecast::Intent classify(const std::string& query) const;

    forecast::Intent keywordFallback(const std::string& query) const;

    /**
     * Intent from the model reply. Throws CapabilityError if unusable.
     */
    forecast::Intent parseReply(const std::string& reply) const;

private:
    int clampHorizon(forecast::Mode mode, int horizon) const;

    std::shared_ptr<ILanguageModel> m_model;
    ClassifierOptions m_options;
};

} // namespace llm
} // namespace rainsight
