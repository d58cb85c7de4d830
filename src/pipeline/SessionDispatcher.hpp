#pragma once

#include "pipeline/WorkflowEngine.hpp"
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace rainsight {
namespace pipeline {

/**
 * Runs workflow sessions on a worker pool so HTTP handlers return at once.
 * Thread-safe.
 *
 * Outcomes of the last `historySize` interactive sessions are kept for
 * inspection; older ones are dropped first.
 */
class SessionDispatcher {
public:
    SessionDispatcher(std::shared_ptr<WorkflowEngine> engine, size_t workers, size_t historySize = 100);
    ~SessionDispatcher();

    SessionDispatcher(const SessionDispatcher&) = delete;
    SessionDispatcher& operator=(const SessionDispatcher&) = delete;

    /**
     * Queue the session whose query record was just created
     */
    void dispatchInteractive(int64_t sessionId);

    /**
     * Queue a chart refresh
     */
    void dispatchScheduled(forecast::Mode mode);

    /**
     * Status of a finished interactive session, nullopt while pending or unknown
     */
    std::optional<TerminalStatus> outcome(int64_t sessionId) const;

    size_t pendingCount() const { return m_pending.load(); }

    /// False once wait() was called
    bool accepting() const;

    /**
     * Block until every queued session finished. The dispatcher accepts no
     * work afterwards.
     */
    void wait();

private:
    void record(int64_t sessionId, TerminalStatus status);

    std::shared_ptr<WorkflowEngine> m_engine;
    boost::asio::thread_pool m_pool;
    std::atomic<size_t> m_pending{0};
    bool m_stopped = false;
    mutable std::mutex m_dispatchMutex;     // guards m_stopped and posting

    size_t m_historySize;
    std::unordered_map<int64_t, TerminalStatus> m_outcomes;
    std::deque<int64_t> m_order;
    mutable std::mutex m_mutex;
};

} // namespace pipeline
} // namespace rainsight
