#include "publish/Publisher.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <thread>

namespace rainsight {
namespace publish {

using forecast::BucketedForecast;
using forecast::Mode;

nlohmann::json PublishOutcome::toJson() const {
    return {
        {"success", success},
        {"attempts", attempts},
        {"status_code", statusCode},
        {"message", message}
    };
}

Publisher::Publisher(PublisherOptions options, std::shared_ptr<net::IHttpTransport> transport)
    : m_options(std::move(options))
    , m_transport(std::move(transport))
{
    while (!m_options.baseUrl.empty() && m_options.baseUrl.back() == '/') {
        m_options.baseUrl.pop_back();
    }
    if (m_options.maxAttempts < 1) {
        m_options.maxAttempts = 1;
    }
}

PublishSink Publisher::sinkFor(Mode mode) const {
    PublishSink sink;
    sink.timeout = m_options.timeout;
    switch (mode) {
        case Mode::Daily:
            sink.url = m_options.baseUrl + "/daily_forecast";
            break;
        case Mode::Monthly:
            sink.url = m_options.baseUrl + "/monthly_forecast";
            break;
        default:
            throw ValidationError("No publish sink for mode " + forecast::modeToString(mode));
    }
    return sink;
}

PublishOutcome Publisher::publish(const BucketedForecast& bucket) const {
    if (bucket.mode == Mode::Unrelated) {
        PublishOutcome outcome;
        outcome.message = "Unrelated forecasts are not published";
        return outcome;
    }
    return publish(bucket, sinkFor(bucket.mode));
}

PublishOutcome Publisher::publish(const BucketedForecast& bucket, const PublishSink& sink) const {
    PublishOutcome outcome;

    if (bucket.mode == Mode::Unrelated || bucket.size() != forecast::bucketSize(bucket.mode)) {
        outcome.message = "Refusing to publish a " + forecast::modeToString(bucket.mode) +
                          " bucket of " + std::to_string(bucket.size()) + " entries";
        LOG_ERROR(outcome.message);
        return outcome;
    }

    net::HttpRequest request;
    request.method = "POST";
    request.url = sink.url;
    request.headers["Content-Type"] = "application/json";
    request.body = bucket.toJson().dump();
    request.timeout = sink.timeout;

    LOG_INFO("Publishing " + forecast::modeToString(bucket.mode) + " forecast to " + sink.url);

    for (int attempt = 1; attempt <= m_options.maxAttempts; ++attempt) {
        outcome.attempts = attempt;
        try {
            net::HttpResponse response = m_transport->send(request);
            outcome.statusCode = response.status;
            if (response.ok()) {
                outcome.success = true;
                outcome.message = "Published";
                LOG_INFO("Forecast published (HTTP " + std::to_string(response.status) + ")");
            } else {
                outcome.message = "Sink rejected forecast with HTTP " + std::to_string(response.status);
                LOG_ERROR(outcome.message + ": " + response.body);
            }
            return outcome;
        } catch (const TransportError& e) {
            outcome.message = e.what();
            LOG_WARN("Publish attempt " + std::to_string(attempt) + "/" +
                     std::to_string(m_options.maxAttempts) + " failed: " + e.what());
        } catch (const std::exception& e) {
            // Bad sink URL, TLS setup: retrying cannot help
            outcome.message = e.what();
            LOG_ERROR("Publishing to " + sink.url + " failed: " + outcome.message);
            return outcome;
        }

        if (attempt < m_options.maxAttempts && m_options.retryDelay.count() > 0) {
            std::this_thread::sleep_for(m_options.retryDelay);
        }
    }

    LOG_ERROR("Giving up publishing to " + sink.url + " after " + std::to_string(outcome.attempts) + " attempts");
    return outcome;
}

} // namespace publish
} // namespace rainsight
