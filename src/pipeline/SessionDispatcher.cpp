#include "pipeline/SessionDispatcher.hpp"
#include "server/Logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>

namespace rainsight {
namespace pipeline {

SessionDispatcher::SessionDispatcher(std::shared_ptr<WorkflowEngine> engine, size_t workers, size_t historySize)
    : m_engine(std::move(engine))
    , m_pool(std::max<size_t>(workers, 1))
    , m_historySize(std::max<size_t>(historySize, 1))
{
    if (!m_engine) {
        throw ValidationError("SessionDispatcher requires a workflow engine");
    }
}

SessionDispatcher::~SessionDispatcher() {
    wait();
}

void SessionDispatcher::dispatchInteractive(int64_t sessionId) {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    if (m_stopped) {
        throw ValidationError("Dispatcher is shut down");
    }

    ++m_pending;
    LOG_DEBUG("Dispatching session " + std::to_string(sessionId));

    boost::asio::post(m_pool, [this, sessionId]() {
        try {
            TerminalResult result = m_engine->run(sessionId);
            record(sessionId, result.status);
        } catch (const std::exception& e) {
            // Rejected before any stage ran (unknown, duplicate or store down)
            LOG_ERROR("[session " + std::to_string(sessionId) + "] Not processed: " + e.what());
            record(sessionId, TerminalStatus::Failed);
        }
        --m_pending;
    });
}

void SessionDispatcher::dispatchScheduled(forecast::Mode mode) {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    if (m_stopped) {
        throw ValidationError("Dispatcher is shut down");
    }

    ++m_pending;
    LOG_DEBUG("Dispatching scheduled " + forecast::modeToString(mode) + " forecast");

    boost::asio::post(m_pool, [this, mode]() {
        try {
            m_engine->runScheduled(mode);
        } catch (const std::exception& e) {
            LOG_ERROR("[scheduled] " + forecast::modeToString(mode) + " forecast not run: " + e.what());
        }
        --m_pending;
    });
}

std::optional<TerminalStatus> SessionDispatcher::outcome(int64_t sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_outcomes.find(sessionId);
    if (it == m_outcomes.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SessionDispatcher::record(int64_t sessionId, TerminalStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_outcomes.count(sessionId) == 0) {
        m_order.push_back(sessionId);
    }
    m_outcomes[sessionId] = status;

    while (m_order.size() > m_historySize) {
        m_outcomes.erase(m_order.front());
        m_order.pop_front();
    }
}

bool SessionDispatcher::accepting() const {
    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    return !m_stopped;
}

void SessionDispatcher::wait() {
    {
        // Nothing can be posted once m_stopped is set under this lock
        std::lock_guard<std::mutex> lock(m_dispatchMutex);
        if (m_stopped) {
            return;
        }
        m_stopped = true;
    }
    m_pool.join();
}

} // namespace pipeline
} // namespace rainsight
