// ============================================================================
// HTTP SCRAPE SOURCE UNIT TESTS
// ============================================================================
// - Prometheus text parsing into EndpointReport
// - URL joining
// - Collection against loopback members (answering, refusing, non-2xx)
// ============================================================================

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <loadscaler/core/ingest/http_scrape_source.hpp>

using namespace LoadScaler;

// ============================================================================
// EXPOSITION PARSING
// ============================================================================

TEST(HttpScrapeSourceParse, ReadsAllCounters) {
    const std::string body =
        "# HELP kv_active_blocks Active KV blocks\n"
        "# TYPE kv_active_blocks gauge\n"
        "request_active_slots 3\n"
        "request_total_slots 16\n"
        "kv_active_blocks 120\n"
        "kv_total_blocks 1000\n"
        "num_requests_waiting 2\n"
        "gpu_cache_usage_perc 0.12\n"
        "gpu_prefix_cache_hit_rate 0.5\n";

    auto report = HttpScrapeSource::parseExposition(body, "llm-worker", "w0");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->endpoint_id, "w0");
    EXPECT_EQ(report->request_active_slots, 3u);
    EXPECT_EQ(report->request_total_slots, 16u);
    EXPECT_EQ(report->kv_active_blocks, 120u);
    EXPECT_EQ(report->kv_total_blocks, 1000u);
    EXPECT_EQ(report->num_requests_waiting, 2u);
    EXPECT_DOUBLE_EQ(report->gpu_cache_usage_perc, 0.12);
    EXPECT_DOUBLE_EQ(report->gpu_prefix_cache_hit_rate, 0.5);
}

TEST(HttpScrapeSourceParse, HonoursComponentLabel) {
    const std::string body =
        "kv_active_blocks{component=\"prefill-worker\"} 999\n"
        "kv_active_blocks{component=\"llm-worker\",endpoint=\"load_metrics\"} 7\r\n"
        "kv_total_blocks{endpoint=\"load_metrics\"} 64\n";

    auto report = HttpScrapeSource::parseExposition(body, "llm-worker", "w1");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kv_active_blocks, 7u);
    EXPECT_EQ(report->kv_total_blocks, 64u);
}

TEST(HttpScrapeSourceParse, MissingKvActiveBlocksIsRejected) {
    const std::string body =
        "# only totals\n"
        "kv_total_blocks 64\n"
        "kv_active_blocks{component=\"other\"} 3\n";
    EXPECT_FALSE(HttpScrapeSource::parseExposition(body, "llm-worker", "w2").has_value());
    EXPECT_FALSE(HttpScrapeSource::parseExposition("", "llm-worker", "w2").has_value());
}

TEST(HttpScrapeSourceParse, SkipsMalformedAndNegativeSamples) {
    const std::string body =
        "kv_active_blocks -4\n"
        "kv_active_blocks not_a_number\n"
        "unrelated_metric 12\n"
        "kv_active_blocks 5 1700000000000\n";

    auto report = HttpScrapeSource::parseExposition(body, "llm-worker", "w3");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kv_active_blocks, 5u);
}

TEST(HttpScrapeSourceParse, RejectsCountsBeyondUint64) {
    const std::string body =
        "kv_active_blocks 1e20\n"
        "kv_total_blocks 18446744073709551616\n";
    // Out-of-range samples are skipped like negative ones
    EXPECT_FALSE(HttpScrapeSource::parseExposition(body, "llm-worker", "w4").has_value());

    auto report = HttpScrapeSource::parseExposition(body + "kv_active_blocks 9\n", "llm-worker", "w4");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kv_active_blocks, 9u);
    EXPECT_EQ(report->kv_total_blocks, 0u);
}

// ============================================================================
// URL BUILDING
// ============================================================================

TEST(HttpScrapeSourceUrl, JoinsWithSingleSlash) {
    EXPECT_EQ(HttpScrapeSource::buildUrl("http://w0:8081", "load_metrics"), "http://w0:8081/load_metrics");
    EXPECT_EQ(HttpScrapeSource::buildUrl("http://w0:8081/", "/load_metrics"), "http://w0:8081/load_metrics");
    EXPECT_EQ(HttpScrapeSource::buildUrl("http://w0:8081//", "metrics"), "http://w0:8081/metrics");
}

// ============================================================================
// COLLECTION
// ============================================================================

TEST(HttpScrapeSourceCollect, NoMembersThrows) {
    HttpScrapeSource source(std::vector<std::string>{});
    EXPECT_THROW(source.collect("llm-worker", "load_metrics", std::chrono::milliseconds(50)),
                 CollectionError);
}

TEST(HttpScrapeSourceCollect, UnreachableFleetThrowsWithinBudget) {
    // Port 1 on loopback refuses connections
    HttpScrapeSource source(std::vector<std::string>{"http://127.0.0.1:1", "http://127.0.0.1:1/"});

    auto before = std::chrono::steady_clock::now();
    EXPECT_THROW(source.collect("llm-worker", "load_metrics", std::chrono::milliseconds(200)),
                 CollectionError);
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(2));
}

TEST(HttpScrapeSourceCollect, ExposesNameAndMembers) {
    HttpScrapeSource source(std::vector<std::string>{"http://a", "http://b"});
    EXPECT_STREQ(source.name(), "http-scrape");
    EXPECT_EQ(source.members().size(), 2u);
}

// ============================================================================
// LOOPBACK HTTP MEMBER
// ============================================================================

namespace {

// Minimal HTTP/1.1 responder on 127.0.0.1: answers every request with a
// fixed status line and body, then closes the connection
class LoopbackMember {
public:
    LoopbackMember(int status, std::string reason, std::string body)
        : status_(status), reason_(std::move(reason)), body_(std::move(body)) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = inet_addr("127.0.0.1");
        addr.sin_port = 0;
        if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            listen(listen_fd_, 8) == 0) {
            socklen_t len = sizeof(addr);
            getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
            port_ = ntohs(addr.sin_port);
            running_ = true;
            thread_ = std::thread(&LoopbackMember::serve, this);
        }
    }

    ~LoopbackMember() {
        running_ = false;
        if (thread_.joinable()) thread_.join();
        if (listen_fd_ >= 0) close(listen_fd_);
    }

    bool ok() const { return port_ != 0; }
    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::string lastRequestLine() {
        std::lock_guard<std::mutex> lock(mtx_);
        return last_request_line_;
    }

private:
    void serve() {
        while (running_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (poll(&pfd, 1, 20) <= 0) continue;
            int conn = accept(listen_fd_, nullptr, nullptr);
            if (conn < 0) continue;

            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = recv(conn, buf, sizeof(buf), 0);
                if (n <= 0) break;
                request.append(buf, static_cast<size_t>(n));
            }
            {
                std::lock_guard<std::mutex> lock(mtx_);
                last_request_line_ = request.substr(0, request.find("\r\n"));
            }

            std::string response = "HTTP/1.1 " + std::to_string(status_) + " " + reason_ + "\r\n"
                                   "Content-Type: text/plain\r\n"
                                   "Content-Length: " + std::to_string(body_.size()) + "\r\n"
                                   "Connection: close\r\n\r\n" + body_;
            size_t sent = 0;
            while (sent < response.size()) {
                ssize_t n = send(conn, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) break;
                sent += static_cast<size_t>(n);
            }
            close(conn);
        }
    }

    int status_;
    std::string reason_;
    std::string body_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mtx_;
    std::string last_request_line_;
};

const char* kWorkerBody =
    "# TYPE kv_active_blocks gauge\n"
    "kv_active_blocks{component=\"llm-worker\"} 10\n"
    "kv_total_blocks{component=\"llm-worker\"} 100\n";

} // namespace

TEST(HttpScrapeSourceCollect, AnsweringMemberYieldsOneReport) {
    LoopbackMember member(200, "OK", kWorkerBody);
    ASSERT_TRUE(member.ok());
    HttpScrapeSource source(std::vector<std::string>{member.url() + "/"});

    auto reports = source.collect("llm-worker", "/load_metrics", std::chrono::milliseconds(2000));

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].endpoint_id, member.url() + "/load_metrics");
    EXPECT_EQ(reports[0].kv_active_blocks, 10u);
    EXPECT_EQ(reports[0].kv_total_blocks, 100u);
    EXPECT_EQ(member.lastRequestLine(), "GET /load_metrics HTTP/1.1");
}

TEST(HttpScrapeSourceCollect, PartialFleetKeepsAnsweringMembers) {
    LoopbackMember member(200, "OK", kWorkerBody);
    ASSERT_TRUE(member.ok());
    HttpScrapeSource source(std::vector<std::string>{member.url(), "http://127.0.0.1:1"});

    auto reports = source.collect("llm-worker", "load_metrics", std::chrono::milliseconds(2000));

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].kv_active_blocks, 10u);
}

TEST(HttpScrapeSourceCollect, NonSuccessStatusIsDropped) {
    LoopbackMember member(404, "Not Found", kWorkerBody);
    ASSERT_TRUE(member.ok());
    HttpScrapeSource source(std::vector<std::string>{member.url()});

    EXPECT_THROW(source.collect("llm-worker", "load_metrics", std::chrono::milliseconds(2000)),
                 CollectionError);
}

TEST(HttpScrapeSourceCollect, MemberWithoutKvSampleIsDropped) {
    LoopbackMember member(200, "OK", "request_active_slots 1\n");
    ASSERT_TRUE(member.ok());
    HttpScrapeSource source(std::vector<std::string>{member.url()});

    EXPECT_THROW(source.collect("llm-worker", "load_metrics", std::chrono::milliseconds(2000)),
                 CollectionError);
}
