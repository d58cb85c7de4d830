#include "pipeline/WorkflowEngine.hpp"
#include "server/Logger.hpp"

namespace rainsight {
namespace pipeline {

using forecast::Mode;

namespace {

const std::string kClassify = "classify";
const std::string kFetch = "fetch";
const std::string kEngineer = "engineer";
const std::string kForecast = "forecast";
const std::string kPublish = "publish";
const std::string kSummarize = "summarize";
const std::string kPersist = "persist";
const std::string kFallback = "fallback";
const std::string kPersistError = "persist_error";
const std::string kStoreForecast = "store_forecast";

std::string sessionLabel(int64_t sessionId) {
    return sessionId > 0 ? "session " + std::to_string(sessionId) : "scheduled";
}

std::string sessionPrefix(int64_t sessionId) {
    return "[" + sessionLabel(sessionId) + "] ";
}

template <class T>
const T& require(const std::optional<T>& value, const char* what) {
    if (!value) {
        throw ValidationError(std::string("Missing ") + what + " in workflow state");
    }
    return *value;
}

nlohmann::json stageErrorJson(const StageError& error) {
    return {
        {"kind", errorKindToString(error.kind)},
        {"stage", error.stage},
        {"message", error.message}
    };
}

nlohmann::json traceJson(const std::vector<ExecutionEvent>& trace) {
    nlohmann::json events = nlohmann::json::array();
    for (const auto& evt : trace) {
        events.push_back(evt.toJson());
    }
    return events;
}

} // anonymous namespace

// =============================================================================
// Results
// =============================================================================

std::string terminalStatusToString(TerminalStatus status) {
    switch (status) {
        case TerminalStatus::Completed: return "completed";
        case TerminalStatus::Fallback: return "fallback";
        case TerminalStatus::Failed: return "failed";
        default: return "unknown";
    }
}

nlohmann::json TerminalResult::toJson() const {
    nlohmann::json j;
    j["session_id"] = sessionId;
    j["status"] = terminalStatusToString(status);
    j["response_text"] = responseText;
    j["persisted"] = persisted;
    if (error) j["error"] = stageErrorJson(*error);
    if (intent) {
        j["intent"] = {
            {"mode", forecast::modeToString(intent->mode)},
            {"horizon", intent->horizon},
            {"confidence", intent->confidence},
            {"explanation", intent->explanation}
        };
    }
    if (bucket) j["forecast"] = bucket->toJson();
    if (publishOutcome) j["publish"] = publishOutcome->toJson();
    j["trace"] = traceJson(trace);
    return j;
}

nlohmann::json ScheduledResult::toJson() const {
    nlohmann::json j;
    j["mode"] = forecast::modeToString(mode);
    j["success"] = success;
    if (bucket) j["forecast"] = bucket->toJson();
    if (publishOutcome) j["publish"] = publishOutcome->toJson();
    if (forecastRecordId) j["forecast_id"] = *forecastRecordId;
    if (error) j["error"] = stageErrorJson(*error);
    j["trace"] = traceJson(trace);
    return j;
}

// =============================================================================
// WorkflowEngine
// =============================================================================

WorkflowEngine::WorkflowEngine(WorkflowCapabilities capabilities, WorkflowOptions options)
    : m_caps(std::move(capabilities))
    , m_options(options)
    , m_bucketer(options.weekAnchor)
{
    if (!m_caps.classifier) throw ValidationError("WorkflowEngine requires an intent classifier");
    if (!m_caps.provider) throw ValidationError("WorkflowEngine requires a data provider");
    if (!m_caps.artifacts) throw ValidationError("WorkflowEngine requires model artifacts");
    if (!m_caps.summarizer) throw ValidationError("WorkflowEngine requires a summarizer");
    if (!m_caps.store) throw ValidationError("WorkflowEngine requires a record store");
    if (!m_caps.clock) {
        m_caps.clock = todayUtc;
    }
}

void WorkflowEngine::setExecutionCallback(ExecutionCallback callback) {
    m_callback = std::move(callback);
}

std::string WorkflowEngine::userMessageFor(ErrorKind kind) {
    if (kind == ErrorKind::InsufficientData) {
        return kInsufficientDataMessage;
    }
    return kUnexpectedMessage;
}

bool WorkflowEngine::isActive(int64_t sessionId) const {
    std::lock_guard<std::mutex> lock(m_activeMutex);
    return m_activeSessions.count(sessionId) > 0;
}

bool WorkflowEngine::acquire(int64_t sessionId) {
    std::lock_guard<std::mutex> lock(m_activeMutex);
    return m_activeSessions.insert(sessionId).second;
}

void WorkflowEngine::release(int64_t sessionId) {
    std::lock_guard<std::mutex> lock(m_activeMutex);
    m_activeSessions.erase(sessionId);
}

StageFunction WorkflowEngine::guarded(const std::string& name, StageBody body) {
    return [name, body = std::move(body)](const WorkflowState& state) -> StageResult {
        try {
            return StageResult::success(body(state));
        } catch (const Error& e) {
            return StageResult::failure(state, StageError{e.kind(), name, e.what()});
        }
    };
}

PipelineRun WorkflowEngine::execute(const PipelineGraph& graph, WorkflowState initial) const {
    PipelineExecutor executor(graph);
    executor.setSessionId(initial.sessionId);
    executor.setExecutionCallback([this](const ExecutionEvent& evt) {
        std::string prefix = sessionPrefix(evt.sessionId);
        switch (evt.status) {
            case ExecutionStatus::Started:
                LOG_DEBUG(prefix + "Stage " + evt.stage + " started");
                break;
            case ExecutionStatus::Completed:
                LOG_INFO(prefix + "Stage " + evt.stage + " completed in " +
                         std::to_string(evt.durationMs) + "ms" +
                         (evt.next.empty() ? "" : ", next " + evt.next));
                break;
            case ExecutionStatus::Failed:
                LOG_WARN(prefix + "Stage " + evt.stage + " failed (" +
                         errorKindToString(evt.errorKind.value_or(ErrorKind::Unexpected)) + "): " +
                         evt.errorMessage + (evt.next.empty() ? "" : ", routed to " + evt.next));
                break;
        }
        if (m_callback) {
            m_callback(evt);
        }
    });
    return executor.execute(std::move(initial));
}

// =============================================================================
// Graphs
// =============================================================================

PipelineGraph WorkflowEngine::buildInteractiveGraph(storage::IStoreSession& store) const {
    PipelineGraph graph;

    graph.addStage(kClassify, guarded(kClassify, [this](const WorkflowState& s) { return classify(s); }));
    graph.addStage(kFetch, guarded(kFetch, [this](const WorkflowState& s) { return fetch(s); }));
    graph.addStage(kEngineer, guarded(kEngineer, [this](const WorkflowState& s) { return engineer(s); }));
    graph.addStage(kForecast, guarded(kForecast, [this](const WorkflowState& s) { return predict(s); }));
    graph.addStage(kPublish, guarded(kPublish, [this](const WorkflowState& s) { return publishBucket(s); }));
    graph.addStage(kSummarize, guarded(kSummarize, [this](const WorkflowState& s) { return summarize(s); }));
    graph.addStage(kPersist, guarded(kPersist, [this, &store](const WorkflowState& s) {
        return persist(s, store);
    }));
    graph.addStage(kFallback, guarded(kFallback, [this, &store](const WorkflowState& s) {
        return fallback(s, store);
    }));
    graph.addStage(kPersistError, guarded(kPersistError, [this, &store](const WorkflowState& s) {
        return persistError(s, store);
    }));

    graph.setEntry(kClassify);
    graph.branch(kClassify, [](const WorkflowState& s) {
        return s.intent && s.intent->mode != Mode::Unrelated ? kFetch : kFallback;
    }, {kFetch, kFallback});
    graph.connect(kFetch, kEngineer);
    graph.connect(kEngineer, kForecast);
    graph.connect(kForecast, kPublish);
    graph.connect(kPublish, kSummarize);
    graph.connect(kSummarize, kPersist);

    graph.onError(kClassify, kFallback);
    graph.setErrorHandler(kPersistError);
    return graph;
}

PipelineGraph WorkflowEngine::buildScheduledGraph(storage::IStoreSession& store) const {
    PipelineGraph graph;

    graph.addStage(kFetch, guarded(kFetch, [this](const WorkflowState& s) { return fetch(s); }));
    graph.addStage(kEngineer, guarded(kEngineer, [this](const WorkflowState& s) { return engineer(s); }));
    graph.addStage(kForecast, guarded(kForecast, [this](const WorkflowState& s) { return predict(s); }));
    graph.addStage(kPublish, guarded(kPublish, [this](const WorkflowState& s) { return publishBucket(s); }));
    graph.addStage(kStoreForecast, guarded(kStoreForecast, [this, &store](const WorkflowState& s) {
        return storeForecast(s, store);
    }));

    graph.setEntry(kFetch);
    graph.connect(kFetch, kEngineer);
    graph.connect(kEngineer, kForecast);
    graph.connect(kForecast, kPublish);
    graph.connect(kPublish, kStoreForecast);
    return graph;
}

// =============================================================================
// Runs
// =============================================================================

TerminalResult WorkflowEngine::run(int64_t sessionId) {
    std::string query;
    {
        auto store = m_caps.store->openSession();
        auto record = store->getQuery(sessionId);
        if (!record) {
            throw ValidationError("Unknown session " + std::to_string(sessionId));
        }
        query = record->queryText;
    }
    return run(sessionId, query);
}

TerminalResult WorkflowEngine::run(int64_t sessionId, const std::string& userQuery) {
    if (sessionId <= 0) {
        throw ValidationError("Invalid session id " + std::to_string(sessionId));
    }
    if (!acquire(sessionId)) {
        throw ValidationError("Session " + std::to_string(sessionId) + " is already running");
    }

    // Released on every exit path
    struct ActiveGuard {
        WorkflowEngine& engine;
        int64_t id;
        ~ActiveGuard() { engine.release(id); }
    } guard{*this, sessionId};

    auto store = m_caps.store->openSession();

    auto record = store->getQuery(sessionId);
    if (!record) {
        throw ValidationError("Unknown session " + std::to_string(sessionId));
    }
    if (record->completed) {
        throw ValidationError("Session " + std::to_string(sessionId) + " was already processed");
    }

    LOG_INFO(sessionPrefix(sessionId) + "Processing query: " + userQuery);

    WorkflowState initial;
    initial.sessionId = sessionId;
    initial.userQuery = userQuery;
    initial.interactive = true;
    initial.today = m_caps.clock();

    PipelineGraph graph = buildInteractiveGraph(*store);
    PipelineRun run = execute(graph, std::move(initial));

    TerminalResult result;
    result.sessionId = sessionId;
    result.responseText = run.state.responseText;
    result.persisted = run.state.completed;
    result.error = run.state.error;
    result.intent = run.state.intent;
    result.forecast = run.state.forecast;
    result.bucket = run.state.bucket;
    result.publishOutcome = run.state.publishOutcome;
    result.trace = std::move(run.trace);

    if (run.terminalStage == kFallback) {
        result.status = TerminalStatus::Fallback;
    } else if (run.state.error || !run.ok()) {
        result.status = TerminalStatus::Failed;
    } else {
        result.status = TerminalStatus::Completed;
    }

    if (!run.ok()) {
        LOG_ERROR(sessionPrefix(sessionId) + "Response could not be persisted: " + run.error->message);
    }

    LOG_INFO(sessionPrefix(sessionId) + "Finished with status " + terminalStatusToString(result.status));
    return result;
}

ScheduledResult WorkflowEngine::runScheduled(Mode mode) {
    if (mode == Mode::Unrelated) {
        throw ValidationError("Scheduled forecasts are daily or monthly");
    }

    forecast::Intent intent;
    intent.mode = mode;
    intent.horizon = static_cast<int>(forecast::bucketSize(mode));
    intent.latitude = m_options.latitude;
    intent.longitude = m_options.longitude;
    intent.confidence = 1.0;
    intent.explanation = "Scheduled " + forecast::modeToString(mode) + " forecast";

    WorkflowState initial;
    initial.interactive = false;
    initial.today = m_caps.clock();
    initial.intent = intent;

    LOG_INFO("[scheduled] Starting " + forecast::modeToString(mode) + " forecast");

    auto store = m_caps.store->openSession();
    PipelineGraph graph = buildScheduledGraph(*store);
    PipelineRun run = execute(graph, std::move(initial));

    ScheduledResult result;
    result.mode = mode;
    result.success = run.ok();
    result.bucket = run.state.bucket;
    result.publishOutcome = run.state.publishOutcome;
    result.forecastRecordId = run.state.storedForecastId;
    result.error = run.error;
    result.trace = std::move(run.trace);

    if (result.success) {
        LOG_INFO("[scheduled] " + forecast::modeToString(mode) + " forecast stored");
    } else {
        LOG_ERROR("[scheduled] " + forecast::modeToString(mode) + " forecast failed: " + run.error->message);
    }
    return result;
}

// =============================================================================
// Stages
// =============================================================================

WorkflowState WorkflowEngine::classify(const WorkflowState& state) const {
    WorkflowState next = state;
    next.intent = m_caps.classifier->classify(state.userQuery);
    return next;
}

WorkflowState WorkflowEngine::fetch(const WorkflowState& state) const {
    const auto& intent = require(state.intent, "intent");
    auto range = m_caps.provider->lookback(intent.mode, state.today);

    WorkflowState next = state;
    next.raw = m_caps.provider->fetch(intent.latitude, intent.longitude, range, intent.mode);
    return next;
}

WorkflowState WorkflowEngine::engineer(const WorkflowState& state) const {
    const auto& intent = require(state.intent, "intent");
    const auto& raw = require(state.raw, "raw series");

    WorkflowState next = state;
    next.window = m_engineer.build(raw, intent.mode);
    next.raw.reset();
    return next;
}

WorkflowState WorkflowEngine::predict(const WorkflowState& state) const {
    const auto& intent = require(state.intent, "intent");
    const auto& window = require(state.window, "feature window");

    const auto& artifacts = m_caps.artifacts->get(intent.mode);
    auto sequence = m_forecaster.forecast(window, intent.horizon, artifacts, sessionLabel(state.sessionId));

    WorkflowState next = state;
    next.bucket = m_bucketer.bucket(sequence, intent.mode, state.today);
    next.forecast = std::move(sequence);
    return next;
}

WorkflowState WorkflowEngine::publishBucket(const WorkflowState& state) const {
    if (!m_caps.publisher) {
        return state;
    }
    if (state.interactive && !m_options.publishInteractive) {
        return state;
    }

    const auto& bucket = require(state.bucket, "bucketed forecast");
    WorkflowState next = state;
    next.publishOutcome = m_caps.publisher->publish(bucket);
    if (!next.publishOutcome->success) {
        LOG_WARN(sessionPrefix(state.sessionId) + "Publishing failed, continuing: " +
                 next.publishOutcome->message);
    }
    return next;
}

WorkflowState WorkflowEngine::summarize(const WorkflowState& state) const {
    const auto& intent = require(state.intent, "intent");
    const auto& bucket = require(state.bucket, "bucketed forecast");

    WorkflowState next = state;
    next.interpretation = m_caps.summarizer->summarize(intent, bucket);
    next.responseText = *next.interpretation;
    return next;
}

WorkflowState WorkflowEngine::persist(const WorkflowState& state, storage::IStoreSession& store) const {
    if (state.responseText.empty()) {
        throw ValidationError("Nothing to persist");
    }
    store.saveResponse(state.sessionId, state.responseText);

    WorkflowState next = state;
    next.completed = true;
    return next;
}

WorkflowState WorkflowEngine::fallback(const WorkflowState& state, storage::IStoreSession& store) const {
    WorkflowState next = state;
    next.responseText = state.error ? kClassificationFailedMessage : kUnrelatedMessage;
    store.saveResponse(state.sessionId, next.responseText);
    next.completed = true;
    return next;
}

WorkflowState WorkflowEngine::persistError(const WorkflowState& state, storage::IStoreSession& store) const {
    WorkflowState next = state;
    next.responseText = userMessageFor(state.error ? state.error->kind : ErrorKind::Unexpected);
    store.saveResponse(state.sessionId, next.responseText);
    next.completed = true;
    return next;
}

WorkflowState WorkflowEngine::storeForecast(const WorkflowState& state, storage::IStoreSession& store) const {
    const auto& bucket = require(state.bucket, "bucketed forecast");

    WorkflowState next = state;
    next.storedForecastId = store.saveForecast(bucket).id;
    next.completed = true;
    return next;
}

} // namespace pipeline
} // namespace rainsight
