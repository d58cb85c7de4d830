#pragma once

#include "forecast/ResultBucketer.hpp"
#include "forecast/Types.hpp"
#include "llm/LanguageModel.hpp"
#include <memory>
#include <string>

namespace rainsight {
namespace llm {

/**
 * User-facing text for a bucketed forecast
 *
 * Never throws on capability failure: the local summary is used instead.
 */
class Summarizer {
public:
    /// Daily total at or above which a day counts as wet
    static constexpr double kWetDayThresholdMm = 1.0;

    explicit Summarizer(std::shared_ptr<ILanguageModel> model);

    std::string summarize(const forecast::Intent& intent, const forecast::BucketedForecast& bucket) const;

    /**
     * Deterministic summary: per-date values, total, wet count, heaviest entry
     */
    static std::string localSummary(const forecast::Intent& intent, const forecast::BucketedForecast& bucket);

private:
    std::shared_ptr<ILanguageModel> m_model;
};

} // namespace llm
} // namespace rainsight
