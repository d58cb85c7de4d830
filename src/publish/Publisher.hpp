#pragma once

#include "forecast/ResultBucketer.hpp"
#include "net/HttpClient.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace rainsight {
namespace publish {

/**
 * Chart endpoint receiving a bucket
 */
struct PublishSink {
    std::string url;
    std::chrono::milliseconds timeout{10000};
};

struct PublishOutcome {
    bool success = false;
    int attempts = 0;
    int statusCode = 0;         // last HTTP status, 0 if none received
    std::string message;

    nlohmann::json toJson() const;
};

struct PublisherOptions {
    std::string baseUrl;
    int maxAttempts = 3;
    std::chrono::milliseconds retryDelay{1000};
    std::chrono::milliseconds timeout{10000};
};

/**
 * Posts bucketed forecasts to <base>/daily_forecast or <base>/monthly_forecast
 *
 * Transport failures are retried with the same payload up to maxAttempts.
 * A non-2xx answer ends the attempt immediately. Buckets of the wrong size
 * are never sent.
 */
class Publisher {
public:
    Publisher(PublisherOptions options, std::shared_ptr<net::IHttpTransport> transport);

    PublishOutcome publish(const forecast::BucketedForecast& bucket) const;
    PublishOutcome publish(const forecast::BucketedForecast& bucket, const PublishSink& sink) const;

    /**
     * Throws ValidationError for Mode::Unrelated
     */
    PublishSink sinkFor(forecast::Mode mode) const;

private:
    PublisherOptions m_options;
    std::shared_ptr<net::IHttpTransport> m_transport;
};

} // namespace publish
} // namespace rainsight
