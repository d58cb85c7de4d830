#include "llm/IntentClassifier.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace rainsight {
namespace llm {

using json = nlohmann::json;
using forecast::Intent;
using forecast::Mode;

namespace {

const char* kSystemPrompt =
    "You are a weather intent classifier.\n"
    "Classify the user query as DAILY, MONTHLY or UNRELATED rainfall forecast request.\n\n"
    "Rules:\n"
    "- 'today', 'tomorrow', 'next 5 days', 'this week' => daily, horizon in days\n"
    "- 'this month', 'next month', 'monthly', 'next 3 months' => monthly, horizon in months\n"
    "- anything not about rainfall or weather => unrelated\n\n"
    "Respond ONLY in valid JSON format:\n"
    "{\n"
    "  \"mode\": \"daily|monthly|unrelated\",\n"
    "  \"horizon\": 7,\n"
    "  \"confidence\": 0.00,\n"
    "  \"explanation\": \"reason\"\n"
    "}";

const char* kFallbackExplanation = "Keyword rule applied: language model classification unavailable";

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // anonymous namespace

IntentClassifier::IntentClassifier(std::shared_ptr<ILanguageModel> model, ClassifierOptions options)
    : m_model(std::move(model))
    , m_options(options)
{}

Intent IntentClassifier::classify(const std::string& query) const {
    if (isBlank(query)) {
        throw ValidationError("Empty user query");
    }

    if (!m_model || !m_model->available()) {
        LOG_INFO("Language model unavailable, classifying by keyword");
        return keywordFallback(query);
    }

    try {
        CompletionRequest request;
        request.system = kSystemPrompt;
        request.user = "User Query: " + query;
        request.temperature = 0.0;
        request.maxTokens = 120;

        Intent intent = parseReply(m_model->complete(request));
        LOG_INFO("Intent classified: " + forecast::modeToString(intent.mode) +
                 " horizon " + std::to_string(intent.horizon) +
                 " (" + std::to_string(intent.confidence) + ")");
        return intent;
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Intent classification failed, using keyword rule: ") + e.what());
        return keywordFallback(query);
    }
}

Intent IntentClassifier::keywordFallback(const std::string& query) const {
    std::string lower = query;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    Intent intent;
    intent.latitude = m_options.latitude;
    intent.longitude = m_options.longitude;
    intent.confidence = kFallbackConfidence;
    intent.explanation = kFallbackExplanation;

    if (lower.find("month") != std::string::npos) {
        intent.mode = Mode::Monthly;
        intent.horizon = kDefaultMonthlyHorizon;
    } else {
        intent.mode = Mode::Daily;
        intent.horizon = kDefaultDailyHorizon;
    }
    return intent;
}

Intent IntentClassifier::parseReply(const std::string& reply) const {
    // Models sometimes wrap the object in a ```json fence
    size_t open = reply.find('{');
    size_t close = reply.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        throw CapabilityError("No JSON object in classifier reply");
    }

    Intent intent;
    intent.latitude = m_options.latitude;
    intent.longitude = m_options.longitude;

    try {
        json doc = json::parse(reply.substr(open, close - open + 1));

        intent.mode = forecast::modeFromString(doc.at("mode").get<std::string>());

        int defaultHorizon = intent.mode == Mode::Monthly ? kDefaultMonthlyHorizon : kDefaultDailyHorizon;
        int horizon = doc.contains("horizon") && !doc["horizon"].is_null()
            ? doc["horizon"].get<int>()
            : defaultHorizon;
        intent.horizon = intent.mode == Mode::Unrelated ? 0 : clampHorizon(intent.mode, horizon);

        double confidence = doc.value("confidence", 0.5);
        intent.confidence = std::clamp(confidence, 0.0, 1.0);
        intent.explanation = doc.value("explanation", "");
    } catch (const json::exception& e) {
        throw CapabilityError(std::string("Invalid classifier reply: ") + e.what());
    } catch (const ValidationError& e) {
        throw CapabilityError(std::string("Invalid classifier reply: ") + e.what());
    }
    return intent;
}

int IntentClassifier::clampHorizon(Mode mode, int horizon) const {
    int max = mode == Mode::Monthly ? m_options.maxMonthlyHorizon : m_options.maxDailyHorizon;
    return std::clamp(horizon, 1, max);
}

} // namespace llm
} // namespace rainsight
