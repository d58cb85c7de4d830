#pragma once

#include "core/Errors.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace rainsight {
namespace pipeline {

enum class ExecutionStatus {
    Started,
    Completed,
    Failed
};

/**
 * One step of a pipeline trace
 *
 * Completed and Failed events carry the duration and the stage the run
 * moves to (`next`, empty when the run ends there). Failed events also
 * carry the error.
 */
struct ExecutionEvent {
    int64_t sessionId = 0;              // 0 for scheduled runs
    std::string stage;
    ExecutionStatus status = ExecutionStatus::Started;
    int64_t durationMs = 0;
    std::string next;
    std::optional<ErrorKind> errorKind;
    std::string errorMessage;

    bool terminal() const { return status != ExecutionStatus::Started && next.empty(); }

    nlohmann::json toJson() const {
        static const char* const names[] = {"started", "completed", "failed"};
        nlohmann::json j{
            {"session_id", sessionId},
            {"stage", stage},
            {"status", names[static_cast<int>(status)]}
        };
        if (status == ExecutionStatus::Started) {
            return j;
        }
        j["duration_ms"] = durationMs;
        j["next"] = next.empty() ? nlohmann::json() : nlohmann::json(next);
        if (errorKind) {
            j["error"] = {{"kind", errorKindToString(*errorKind)}, {"message", errorMessage}};
        }
        return j;
    }
};

using ExecutionCallback = std::function<void(const ExecutionEvent&)>;

} // namespace pipeline
} // namespace rainsight
