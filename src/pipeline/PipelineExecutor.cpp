#include "pipeline/PipelineExecutor.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <queue>
#include <stdexcept>

namespace rainsight {
namespace pipeline {

// =============================================================================
// PipelineGraph Implementation
// =============================================================================

void PipelineGraph::addStage(const std::string& name, StageFunction run) {
    if (m_stages.count(name)) {
        throw std::runtime_error("Duplicate pipeline stage: " + name);
    }
    m_stages[name] = Stage{name, std::move(run)};
    m_stageOrder.push_back(name);
}

const Stage* PipelineGraph::getStage(const std::string& name) const {
    auto it = m_stages.find(name);
    return it != m_stages.end() ? &it->second : nullptr;
}

void PipelineGraph::connect(const std::string& source, const std::string& target) {
    Transition transition;
    transition.source = source;
    transition.targets = {target};
    m_transitions[source] = std::move(transition);
}

void PipelineGraph::branch(const std::string& source, Router router, std::vector<std::string> targets) {
    Transition transition;
    transition.source = source;
    transition.targets = std::move(targets);
    transition.router = std::move(router);
    m_transitions[source] = std::move(transition);
}

const Transition* PipelineGraph::getTransition(const std::string& source) const {
    auto it = m_transitions.find(source);
    return it != m_transitions.end() ? &it->second : nullptr;
}

void PipelineGraph::onError(const std::string& stage, const std::string& handler) {
    m_errorRoutes[stage] = handler;
}

std::optional<std::string> PipelineGraph::errorRoute(const std::string& stage) const {
    auto it = m_errorRoutes.find(stage);
    if (it != m_errorRoutes.end()) {
        return it->second;
    }
    if (!m_errorHandler.empty() && stage != m_errorHandler) {
        return m_errorHandler;
    }
    return std::nullopt;
}

std::vector<std::string> PipelineGraph::validate() const {
    if (m_entry.empty() || !getStage(m_entry)) {
        throw std::runtime_error("Pipeline entry stage not found: '" + m_entry + "'");
    }
    if (!m_errorHandler.empty() && !getStage(m_errorHandler)) {
        throw std::runtime_error("Pipeline error handler not found: " + m_errorHandler);
    }

    // Build adjacency list and in-degree count over success and error edges
    std::unordered_map<std::string, std::vector<std::string>> dependents;
    std::unordered_map<std::string, int> inDegree;
    for (const auto& name : m_stageOrder) {
        inDegree[name] = 0;
    }

    auto addEdge = [&](const std::string& from, const std::string& to) {
        if (!getStage(from) || !getStage(to)) {
            throw std::runtime_error("Pipeline edge references unknown stage: " + from + " -> " + to);
        }
        dependents[from].push_back(to);
        inDegree[to]++;
    };

    for (const auto& [source, transition] : m_transitions) {
        for (const auto& target : transition.targets) {
            addEdge(source, target);
        }
    }
    for (const auto& name : m_stageOrder) {
        auto route = errorRoute(name);
        if (route) {
            addEdge(name, *route);
        }
    }

    std::queue<std::string> ready;
    for (const auto& name : m_stageOrder) {
        if (inDegree[name] == 0) {
            ready.push(name);
        }
    }

    std::vector<std::string> order;
    while (!ready.empty()) {
        std::string name = ready.front();
        ready.pop();
        order.push_back(name);

        for (const auto& dependent : dependents[name]) {
            if (--inDegree[dependent] == 0) {
                ready.push(dependent);
            }
        }
    }

    // Check for cycles
    if (order.size() != m_stages.size()) {
        throw std::runtime_error("Cycle detected in pipeline graph");
    }
    return order;
}

// =============================================================================
// PipelineExecutor Implementation
// =============================================================================

PipelineExecutor::PipelineExecutor(const PipelineGraph& graph)
    : m_graph(graph)
{}

void PipelineExecutor::setExecutionCallback(ExecutionCallback callback) {
    m_callback = std::move(callback);
}

void PipelineExecutor::emit(PipelineRun& run, ExecutionEvent event) const {
    event.sessionId = m_sessionId;
    if (m_callback) {
        m_callback(event);
    }
    run.trace.push_back(std::move(event));
}

StageResult PipelineExecutor::runStage(const Stage& stage, const WorkflowState& state) const {
    try {
        return stage.run(state);
    } catch (const Error& e) {
        return StageResult::failure(state, StageError{e.kind(), stage.name, e.what()});
    } catch (const std::exception& e) {
        LOG_ERROR("[session " + std::to_string(m_sessionId) + "] Unexpected error in stage " +
                  stage.name + ": " + e.what());
        return StageResult::failure(state, StageError{ErrorKind::Unexpected, stage.name, e.what()});
    }
}

std::string PipelineExecutor::nextStage(const std::string& current, const WorkflowState& state) const {
    const Transition* transition = m_graph.getTransition(current);
    if (!transition) {
        return "";
    }
    if (!transition->router) {
        return transition->targets.front();
    }

    std::string next = transition->router(state);
    if (std::find(transition->targets.begin(), transition->targets.end(), next) == transition->targets.end()) {
        throw std::runtime_error("Router of stage " + current + " returned undeclared target '" + next + "'");
    }
    return next;
}

PipelineRun PipelineExecutor::execute(WorkflowState initial) {
    m_graph.validate();

    PipelineRun run;
    run.state = std::move(initial);

    std::string current = m_graph.entry();
    const size_t maxSteps = m_graph.stageCount();

    while (!current.empty()) {
        if (run.path.size() >= maxSteps) {
            throw std::runtime_error("Pipeline exceeded " + std::to_string(maxSteps) + " steps");
        }

        const Stage* stage = m_graph.getStage(current);
        run.path.push_back(current);
        run.terminalStage = current;

        // Emit "started" event
        ExecutionEvent started;
        started.stage = current;
        started.status = ExecutionStatus::Started;
        emit(run, started);

        auto startTime = std::chrono::steady_clock::now();
        StageResult result = runStage(*stage, run.state);
        auto endTime = std::chrono::steady_clock::now();
        auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();

        run.state = std::move(result.state);

        ExecutionEvent evt;
        evt.stage = current;
        evt.durationMs = durationMs;

        if (result.ok()) {
            evt.status = ExecutionStatus::Completed;
            std::string completed = current;
            try {
                current = nextStage(completed, run.state);
            } catch (const std::exception& e) {
                StageError error{ErrorKind::Unexpected, completed, e.what()};
                LOG_ERROR("[session " + std::to_string(m_sessionId) + "] " + error.message);
                run.state.error = error;
                auto route = m_graph.errorRoute(completed);
                if (route) {
                    current = *route;
                } else {
                    run.error = error;
                    current.clear();
                }
            }
            evt.next = current;
            emit(run, evt);
            continue;
        }

        StageError error = *result.error;
        error.stage = current;
        evt.status = ExecutionStatus::Failed;
        evt.errorKind = error.kind;
        evt.errorMessage = error.message;

        // A failing error handler ends the run
        bool handlingError = run.state.error.has_value();
        run.state.error = error;

        std::optional<std::string> route;
        if (!handlingError) {
            route = m_graph.errorRoute(current);
        }
        if (route) {
            current = *route;
        } else {
            run.error = error;
            current.clear();
        }
        evt.next = current;
        emit(run, evt);
    }

    return run;
}

} // namespace pipeline
} // namespace rainsight
