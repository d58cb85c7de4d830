#pragma once

#include "core/Calendar.hpp"
#include "core/Errors.hpp"
#include "forecast/FeatureEngineer.hpp"
#include "forecast/Forecaster.hpp"
#include "forecast/RawSeries.hpp"
#include "forecast/ResultBucketer.hpp"
#include "forecast/Types.hpp"
#include "publish/Publisher.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace rainsight {
namespace pipeline {

/**
 * Failure reported by a stage
 */
struct StageError {
    ErrorKind kind = ErrorKind::Unexpected;
    std::string stage;
    std::string message;
};

/**
 * Record threaded through the pipeline
 *
 * Stages receive it by const reference and return an updated copy.
 */
struct WorkflowState {
    int64_t sessionId = 0;          // query record id, 0 for scheduled runs
    std::string userQuery;
    bool interactive = true;
    CivilDate today;

    std::optional<forecast::Intent> intent;
    std::optional<forecast::RawSeries> raw;
    std::optional<forecast::FeatureWindow> window;
    std::optional<forecast::ForecastSequence> forecast;
    std::optional<forecast::BucketedForecast> bucket;
    std::optional<publish::PublishOutcome> publishOutcome;
    std::optional<std::string> interpretation;
    std::optional<int64_t> storedForecastId;

    std::optional<StageError> error;
    std::string responseText;
    bool completed = false;
};

/**
 * Outcome of one stage: the new state and, on failure, the typed error
 */
struct StageResult {
    WorkflowState state;
    std::optional<StageError> error;

    bool ok() const { return !error.has_value(); }

    static StageResult success(WorkflowState state) {
        return StageResult{std::move(state), std::nullopt};
    }

    static StageResult failure(WorkflowState state, StageError error) {
        return StageResult{std::move(state), std::move(error)};
    }
};

using StageFunction = std::function<StageResult(const WorkflowState&)>;

/**
 * Picks the next stage after a successful stage
 */
using Router = std::function<std::string(const WorkflowState&)>;

} // namespace pipeline
} // namespace rainsight
