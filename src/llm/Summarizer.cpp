#include "llm/Summarizer.hpp"
#include "server/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace rainsight {
namespace llm {

using forecast::BucketedForecast;
using forecast::Intent;
using forecast::Mode;

namespace {

std::string formatMm(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " mm";
    return oss.str();
}

std::string entryLabel(Mode mode, const CivilDate& date) {
    std::string iso = toIsoString(date);
    return mode == Mode::Monthly ? iso.substr(0, 7) : iso;
}

std::string buildPrompt(const Intent& intent, const BucketedForecast& bucket) {
    std::ostringstream oss;
    oss << "The " << forecast::modeToString(bucket.mode) << " rainfall forecast for location (lat="
        << intent.latitude << ", lon=" << intent.longitude << ") is:\n"
        << bucket.toJson().dump(2) << "\n\n"
        << "Please produce a concise, human-friendly interpretation that includes:\n"
        << "1) A 2-3 sentence summary of the rainfall expectation (e.g., number of wet days, heavy rainfall risk)\n"
        << "2) 3 short, actionable recommendations for farmers/water managers (use bullet points)\n"
        << "Keep it short and direct.";
    return oss.str();
}

} // anonymous namespace

Summarizer::Summarizer(std::shared_ptr<ILanguageModel> model)
    : m_model(std::move(model))
{}

std::string Summarizer::summarize(const Intent& intent, const BucketedForecast& bucket) const {
    if (m_model && m_model->available()) {
        try {
            CompletionRequest request;
            request.system = "You are an expert meteorologist and agricultural advisor.";
            request.user = buildPrompt(intent, bucket);
            request.temperature = 0.6;
            request.maxTokens = 400;

            std::string text = m_model->complete(request);
            if (!text.empty()) {
                return text;
            }
            LOG_WARN("Empty interpretation from language model, using local summary");
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Interpretation failed, using local summary: ") + e.what());
        }
    }
    return localSummary(intent, bucket);
}

std::string Summarizer::localSummary(const Intent& intent, const BucketedForecast& bucket) {
    std::ostringstream oss;
    oss << (bucket.mode == Mode::Monthly ? "Monthly" : "Daily")
        << " rainfall outlook for (" << intent.latitude << ", " << intent.longitude << "):\n";

    double total = 0.0;
    int wet = 0;
    const forecast::BucketEntry* heaviest = nullptr;

    for (const auto& entry : bucket.entries) {
        oss << "- " << entryLabel(bucket.mode, entry.date) << ": " << formatMm(entry.rainfallMm) << "\n";
        total += entry.rainfallMm;
        if (entry.rainfallMm >= kWetDayThresholdMm) ++wet;
        if (!heaviest || entry.rainfallMm > heaviest->rainfallMm) heaviest = &entry;
    }

    const char* unit = bucket.mode == Mode::Monthly ? "months" : "days";
    oss << "Total " << formatMm(total) << " over " << bucket.entries.size() << " " << unit
        << ", " << wet << " wet " << unit << ".";

    if (heaviest && heaviest->rainfallMm > 0.0) {
        oss << " Heaviest: " << entryLabel(bucket.mode, heaviest->date)
            << " with " << formatMm(heaviest->rainfallMm) << ".";
    } else {
        oss << " No rainfall expected.";
    }
    return oss.str();
}

} // namespace llm
} // namespace rainsight
