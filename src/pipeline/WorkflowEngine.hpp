#pragma once

#include "forecast/FeatureEngineer.hpp"
#include "forecast/Forecaster.hpp"
#include "forecast/ModelArtifacts.hpp"
#include "forecast/ResultBucketer.hpp"
#include "llm/IntentClassifier.hpp"
#include "llm/Summarizer.hpp"
#include "pipeline/PipelineExecutor.hpp"
#include "provider/DataProvider.hpp"
#include "publish/Publisher.hpp"
#include "storage/RecordStore.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace rainsight {
namespace pipeline {

/**
 * Collaborators, built once at startup and shared by every session
 */
struct WorkflowCapabilities {
    std::shared_ptr<llm::IntentClassifier> classifier;
    std::shared_ptr<provider::IDataProvider> provider;
    std::shared_ptr<const forecast::ArtifactRegistry> artifacts;
    std::shared_ptr<llm::Summarizer> summarizer;
    std::shared_ptr<publish::Publisher> publisher;      // null: publishing disabled
    std::shared_ptr<storage::IRecordStore> store;
    std::function<CivilDate()> clock;                   // defaults to todayUtc
};

struct WorkflowOptions {
    bool publishInteractive = true;
    forecast::WeekAnchor weekAnchor = forecast::WeekAnchor::Current;
    double latitude = 6.585;
    double longitude = 3.983;
};

enum class TerminalStatus {
    Completed,  // forecast answered
    Fallback,   // unrelated or unclassifiable query
    Failed      // a stage after classification failed
};

std::string terminalStatusToString(TerminalStatus status);

struct TerminalResult {
    int64_t sessionId = 0;
    TerminalStatus status = TerminalStatus::Failed;
    std::string responseText;
    bool persisted = false;
    std::optional<StageError> error;
    std::optional<forecast::Intent> intent;
    std::optional<forecast::ForecastSequence> forecast;
    std::optional<forecast::BucketedForecast> bucket;
    std::optional<publish::PublishOutcome> publishOutcome;
    std::vector<ExecutionEvent> trace;

    nlohmann::json toJson() const;
};

struct ScheduledResult {
    forecast::Mode mode = forecast::Mode::Daily;
    bool success = false;
    std::optional<forecast::BucketedForecast> bucket;
    std::optional<publish::PublishOutcome> publishOutcome;
    std::optional<int64_t> forecastRecordId;
    std::optional<StageError> error;
    std::vector<ExecutionEvent> trace;

    nlohmann::json toJson() const;
};

/**
 * Runs the rainfall question pipeline
 *
 *   classify -> fetch -> engineer -> forecast -> publish -> summarize -> persist
 *       \-> fallback (unrelated or classification failed)
 *   any failure after classify -> persist_error
 *
 * Every session writes exactly one response to its query record. A session
 * id already running or already completed is rejected with ValidationError
 * before anything is written.
 */
class WorkflowEngine {
public:
    static constexpr const char* kUnrelatedMessage =
        "The query you submitted appears unrelated to rainfall prediction. "
        "Please ask about daily or monthly rainfall forecasts for a specific location.";
    static constexpr const char* kClassificationFailedMessage =
        "I could not process your request due to an uncertain intent or missing parameters. "
        "Please ensure your query clearly specifies a daily or monthly forecast.";
    static constexpr const char* kInsufficientDataMessage =
        "There is not enough recent weather data for this location to produce a forecast. "
        "Please try again later.";
    static constexpr const char* kUnexpectedMessage =
        "Sorry, something went wrong while preparing your rainfall forecast. Please try again later.";

    /**
     * Throws ValidationError if a mandatory capability is missing
     */
    WorkflowEngine(WorkflowCapabilities capabilities, WorkflowOptions options = {});

    /**
     * Observer for stage events, set before the first run
     */
    void setExecutionCallback(ExecutionCallback callback);

    /**
     * Process a session whose query record already exists
     */
    TerminalResult run(int64_t sessionId, const std::string& userQuery);

    /**
     * Same, loading the query text from the store
     */
    TerminalResult run(int64_t sessionId);

    /**
     * Forecast-only pipeline for chart refreshes (no user session)
     */
    ScheduledResult runScheduled(forecast::Mode mode);

    bool isActive(int64_t sessionId) const;

    /**
     * Text persisted for a failed session
     */
    static std::string userMessageFor(ErrorKind kind);

private:
    using StageBody = std::function<WorkflowState(const WorkflowState&)>;

    /**
     * Wrap a stage body: rainsight::Error becomes a typed StageError
     */
    static StageFunction guarded(const std::string& name, StageBody body);

    PipelineGraph buildInteractiveGraph(storage::IStoreSession& store) const;
    PipelineGraph buildScheduledGraph(storage::IStoreSession& store) const;

    WorkflowState classify(const WorkflowState& state) const;
    WorkflowState fetch(const WorkflowState& state) const;
    WorkflowState engineer(const WorkflowState& state) const;
    WorkflowState predict(const WorkflowState& state) const;
    WorkflowState publishBucket(const WorkflowState& state) const;
    WorkflowState summarize(const WorkflowState& state) const;
    WorkflowState persist(const WorkflowState& state, storage::IStoreSession& store) const;
    WorkflowState fallback(const WorkflowState& state, storage::IStoreSession& store) const;
    WorkflowState persistError(const WorkflowState& state, storage::IStoreSession& store) const;
    WorkflowState storeForecast(const WorkflowState& state, storage::IStoreSession& store) const;

    PipelineRun execute(const PipelineGraph& graph, WorkflowState initial) const;

    bool acquire(int64_t sessionId);
    void release(int64_t sessionId);

    WorkflowCapabilities m_caps;
    WorkflowOptions m_options;
    forecast::FeatureEngineer m_engineer;
    forecast::Forecaster m_forecaster;
    forecast::ResultBucketer m_bucketer;
    ExecutionCallback m_callback;

    mutable std::mutex m_activeMutex;
    std::unordered_set<int64_t> m_activeSessions;
};

} // namespace pipeline
} // namespace rainsight
