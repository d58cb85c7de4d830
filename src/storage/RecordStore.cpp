#include "storage/RecordStore.hpp"

namespace rainsight {
namespace storage {

nlohmann::json QueryRecord::toJson() const {
    nlohmann::json j;
    j["query_id"] = id;
    j["user_id"] = userId;
    j["query_text"] = queryText;
    j["response_text"] = responseText ? nlohmann::json(*responseText) : nlohmann::json(nullptr);
    j["response_time"] = responseTime ? nlohmann::json(*responseTime) : nlohmann::json(nullptr);
    j["created_at"] = createdAt;
    j["is_completed"] = completed;
    return j;
}

nlohmann::json ForecastRecord::toJson() const {
    return {
        {"id", id},
        {"forecast_type", forecast::modeToString(mode)},
        {"forecast_data", payload},
        {"created_at", createdAt}
    };
}

} // namespace storage
} // namespace rainsight
