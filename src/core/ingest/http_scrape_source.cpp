#include <loadscaler/core/ingest/http_scrape_source.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <sstream>

using namespace LoadScaler;

namespace {

struct Transfer {
    std::string url;
    std::string body;
    CURL* easy = nullptr;
    bool done = false;
    CURLcode result = CURLE_OK;
    long http_status = 0;
};

struct MultiCleanup {
    void operator()(CURLM* multi) const { curl_multi_cleanup(multi); }
};

// Detaches and frees every easy handle before the multi handle goes away
class TransferSet {
public:
    explicit TransferSet(CURLM* multi) : multi_(multi) {}
    ~TransferSet() {
        for (auto& t : transfers_) {
            if (t->easy) {
                curl_multi_remove_handle(multi_, t->easy);
                curl_easy_cleanup(t->easy);
            }
        }
    }
    std::vector<std::unique_ptr<Transfer>>& items() { return transfers_; }

private:
    CURLM* multi_;
    std::vector<std::unique_ptr<Transfer>> transfers_;
};

bool parseNumber(const std::string& token, double& out) {
    if (token.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(token.c_str(), &end);
    return end != token.c_str() && *end == '\0' && errno != ERANGE && std::isfinite(out);
}

// Extracts the value of `key="..."` from a label set, empty if absent
std::string labelValue(const std::string& labels, const std::string& key) {
    const std::string needle = key + "=\"";
    size_t pos = 0;
    while ((pos = labels.find(needle, pos)) != std::string::npos) {
        if (pos == 0 || labels[pos - 1] == ',' || labels[pos - 1] == ' ') {
            size_t start = pos + needle.size();
            size_t end = labels.find('"', start);
            if (end == std::string::npos) return {};
            return labels.substr(start, end - start);
        }
        pos += needle.size();
    }
    return {};
}

bool assignCounter(EndpointReport& report, const std::string& metric, double value) {
    auto asCount = [&](uint64_t& field) {
        // 2^64: anything at or above does not fit a uint64_t
        if (value < 0.0 || value >= 18446744073709551616.0) return false;
        field = static_cast<uint64_t>(value);
        return true;
    };

    if (metric == "request_active_slots") return asCount(report.request_active_slots);
    if (metric == "request_total_slots")  return asCount(report.request_total_slots);
    if (metric == "kv_active_blocks")     return asCount(report.kv_active_blocks);
    if (metric == "kv_total_blocks")      return asCount(report.kv_total_blocks);
    if (metric == "num_requests_waiting") return asCount(report.num_requests_waiting);
    if (metric == "gpu_cache_usage_perc") {
        report.gpu_cache_usage_perc = value;
        return true;
    }
    if (metric == "gpu_prefix_cache_hit_rate") {
        report.gpu_prefix_cache_hit_rate = value;
        return true;
    }
    return false;
}

} // namespace

HttpScrapeSource::HttpScrapeSource(std::vector<std::string> members)
    : members_(std::move(members)) {
    static std::once_flag curl_init;
    std::call_once(curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    spdlog::info("[HttpScrapeSource] Watching {} fleet member(s)", members_.size());
}

size_t HttpScrapeSource::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string HttpScrapeSource::buildUrl(const std::string& member, const std::string& endpoint) {
    std::string url = member;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    size_t start = endpoint.find_first_not_of('/');
    return url + "/" + (start == std::string::npos ? std::string() : endpoint.substr(start));
}

std::vector<EndpointReport> HttpScrapeSource::collect(const std::string& component,
                                                      const std::string& endpoint,
                                                      std::chrono::milliseconds timeout) {
    if (members_.empty()) {
        throw CollectionError("no fleet members configured for " + component);
    }

    std::unique_ptr<CURLM, MultiCleanup> multi(curl_multi_init());
    if (!multi) {
        throw CollectionError("curl_multi_init failed");
    }

    TransferSet transfers(multi.get());
    for (const auto& member : members_) {
        auto t = std::make_unique<Transfer>();
        t->url = buildUrl(member, endpoint);
        t->easy = curl_easy_init();
        if (!t->easy) {
            throw CollectionError("curl_easy_init failed");
        }
        curl_easy_setopt(t->easy, CURLOPT_URL, t->url.c_str());
        curl_easy_setopt(t->easy, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(t->easy, CURLOPT_WRITEDATA, &t->body);
        curl_easy_setopt(t->easy, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(t->easy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(t->easy, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(t->easy, CURLOPT_PRIVATE, static_cast<void*>(t.get()));
        CURL* easy = t->easy;
        transfers.items().push_back(std::move(t));
        CURLMcode rc = curl_multi_add_handle(multi.get(), easy);
        if (rc != CURLM_OK) {
            throw CollectionError(std::string("curl_multi_add_handle: ") + curl_multi_strerror(rc));
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int still_running = 0;
    curl_multi_perform(multi.get(), &still_running);
    while (still_running > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        CURLMcode rc = curl_multi_poll(multi.get(), nullptr, 0, static_cast<int>(remaining.count()), nullptr);
        if (rc != CURLM_OK) {
            throw CollectionError(std::string("curl_multi_poll: ") + curl_multi_strerror(rc));
        }
        curl_multi_perform(multi.get(), &still_running);
    }

    int pending = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi.get(), &pending)) {
        if (msg->msg != CURLMSG_DONE) continue;
        char* priv = nullptr;
        curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
        auto* t = reinterpret_cast<Transfer*>(priv);
        if (!t) continue;
        t->done = true;
        t->result = msg->data.result;
        curl_easy_getinfo(msg->easy_handle, CURLINFO_RESPONSE_CODE, &t->http_status);
    }

    std::vector<EndpointReport> reports;
    reports.reserve(transfers.items().size());
    size_t failed = 0;
    for (const auto& t : transfers.items()) {
        if (!t->done) {
            ++failed;
            spdlog::debug("[HttpScrapeSource] {} did not answer within {}ms", t->url, timeout.count());
            continue;
        }
        if (t->result != CURLE_OK) {
            ++failed;
            spdlog::debug("[HttpScrapeSource] {} failed: {}", t->url, curl_easy_strerror(t->result));
            continue;
        }
        if (t->http_status < 200 || t->http_status >= 300) {
            ++failed;
            spdlog::debug("[HttpScrapeSource] {} returned HTTP {}", t->url, t->http_status);
            continue;
        }
        auto report = parseExposition(t->body, component, t->url);
        if (!report) {
            ++failed;
            spdlog::debug("[HttpScrapeSource] {} exposes no kv_active_blocks sample", t->url);
            continue;
        }
        reports.push_back(std::move(*report));
    }

    if (reports.empty()) {
        throw CollectionError("no fleet member of " + component + " responded (" +
                              std::to_string(failed) + " of " + std::to_string(members_.size()) + " failed)");
    }
    if (failed > 0) {
        spdlog::debug("[HttpScrapeSource] {} of {} member(s) reported", reports.size(), members_.size());
    }
    return reports;
}

std::optional<EndpointReport> HttpScrapeSource::parseExposition(const std::string& body,
                                                                const std::string& component,
                                                                const std::string& endpoint_id) {
    EndpointReport report;
    report.endpoint_id = endpoint_id;
    bool has_kv_active = false;

    std::istringstream iss(body);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;

        size_t name_end = line.find_first_of("{ \t", first);
        if (name_end == std::string::npos) continue;
        std::string metric = line.substr(first, name_end - first);

        size_t value_start = name_end;
        if (line[name_end] == '{') {
            size_t close = line.find('}', name_end);
            if (close == std::string::npos) continue;
            std::string labels = line.substr(name_end + 1, close - name_end - 1);
            std::string owner = labelValue(labels, "component");
            if (!owner.empty() && owner != component) continue;
            value_start = close + 1;
        }

        std::istringstream rest(line.substr(value_start));
        std::string token;
        double value = 0.0;
        if (!(rest >> token) || !parseNumber(token, value)) continue;

        if (assignCounter(report, metric, value) && metric == "kv_active_blocks") {
            has_kv_active = true;
        }
    }

    if (!has_kv_active) {
        return std::nullopt;
    }
    return report;
}
