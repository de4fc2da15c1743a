#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <loadscaler/core/refresh/metrics_source.hpp>

namespace LoadScaler {

/**
 * Scrapes every fleet member's Prometheus text endpoint in parallel.
 *
 * GET <member>/<endpoint> for each member, all bounded by one deadline.
 * Members that fail or time out are left out of the result; if none
 * answers, collect() throws CollectionError.
 */
class HttpScrapeSource final : public MetricsSource {
public:
    explicit HttpScrapeSource(std::vector<std::string> members);
    ~HttpScrapeSource() override = default;

    std::vector<EndpointReport> collect(const std::string& component,
                                        const std::string& endpoint,
                                        std::chrono::milliseconds timeout) override;

    const char* name() const override { return "http-scrape"; }

    const std::vector<std::string>& members() const { return members_; }

    /**
     * Reads the forward-pass counters out of one exposition body.
     * Samples labelled with another component are skipped.
     * @return nullopt if kv_active_blocks is absent
     */
    static std::optional<EndpointReport> parseExposition(const std::string& body,
                                                         const std::string& component,
                                                         const std::string& endpoint_id);

    static std::string buildUrl(const std::string& member, const std::string& endpoint);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::vector<std::string> members_;
};

} // namespace LoadScaler
