#pragma once

#include "pipeline/ExecutionEvent.hpp"
#include "pipeline/WorkflowState.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rainsight {
namespace pipeline {

/**
 * Named stage of a pipeline
 */
struct Stage {
    std::string name;
    StageFunction run;
};

/**
 * Outgoing edge(s) of a stage
 *
 * Without a router the single target is taken unconditionally. With a
 * router, the returned name must be one of the declared targets.
 */
struct Transition {
    std::string source;
    std::vector<std::string> targets;
    Router router;
};

/**
 * A directed, acyclic pipeline of stages
 *
 * A stage without outgoing transition is terminal. Failed stages are routed
 * to their own error route (onError) or to the global error handler.
 *
 * Usage:
 *   PipelineGraph g;
 *   g.addStage("classify", classify);
 *   g.addStage("fetch", fetch);
 *   g.addStage("fallback", fallback);
 *   g.setEntry("classify");
 *   g.branch("classify", router, {"fetch", "fallback"});
 *   g.onError("classify", "fallback");
 */
class PipelineGraph {
public:
    PipelineGraph() = default;

    // === Stages ===

    /**
     * Register a stage. Throws std::runtime_error if the name is taken.
     */
    void addStage(const std::string& name, StageFunction run);

    const Stage* getStage(const std::string& name) const;
    size_t stageCount() const { return m_stages.size(); }

    // === Transitions ===

    void connect(const std::string& source, const std::string& target);
    void branch(const std::string& source, Router router, std::vector<std::string> targets);
    const Transition* getTransition(const std::string& source) const;

    void setEntry(const std::string& name) { m_entry = name; }
    const std::string& entry() const { return m_entry; }

    // === Error routing ===

    /**
     * Stage reached when any stage without its own error route fails
     */
    void setErrorHandler(const std::string& name) { m_errorHandler = name; }
    const std::string& errorHandler() const { return m_errorHandler; }

    /**
     * Specific error route for one stage
     */
    void onError(const std::string& stage, const std::string& handler);

    /**
     * Where a failure of `stage` goes (nullopt: the run stops)
     */
    std::optional<std::string> errorRoute(const std::string& stage) const;

    /**
     * Check that every referenced stage exists and that the graph has no
     * cycle. Returns a topological order. Throws std::runtime_error.
     */
    std::vector<std::string> validate() const;

private:
    std::unordered_map<std::string, Stage> m_stages;
    std::vector<std::string> m_stageOrder;
    std::unordered_map<std::string, Transition> m_transitions;
    std::unordered_map<std::string, std::string> m_errorRoutes;
    std::string m_entry;
    std::string m_errorHandler;
};

/**
 * Result of a pipeline execution
 */
struct PipelineRun {
    WorkflowState state;
    std::vector<std::string> path;          // stages in execution order
    std::vector<ExecutionEvent> trace;
    std::optional<StageError> error;        // failure nobody handled
    std::string terminalStage;

    bool ok() const { return !error.has_value(); }
};

/**
 * Executes a pipeline graph
 *
 * Stages run strictly sequentially. Exceptions escaping a stage are turned
 * into a StageError (rainsight::Error keeps its kind, anything else becomes
 * Unexpected) so routing never depends on message strings.
 */
class PipelineExecutor {
public:
    explicit PipelineExecutor(const PipelineGraph& graph);

    /**
     * Set callback for real-time execution events
     */
    void setExecutionCallback(ExecutionCallback callback);

    /**
     * Session id stamped on events
     */
    void setSessionId(int64_t sessionId) { m_sessionId = sessionId; }

    PipelineRun execute(WorkflowState initial);

private:
    /**
     * Run one stage, converting exceptions into a failed StageResult
     */
    StageResult runStage(const Stage& stage, const WorkflowState& state) const;

    /**
     * Successor of a successful stage, empty string if terminal
     */
    std::string nextStage(const std::string& current, const WorkflowState& state) const;

    void emit(PipelineRun& run, ExecutionEvent event) const;

    const PipelineGraph& m_graph;
    ExecutionCallback m_callback;  // Optional callback for real-time events
    int64_t m_sessionId = 0;
};

} // namespace pipeline
} // namespace rainsight
