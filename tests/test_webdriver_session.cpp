#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "collector/scrape_collector.hpp"
#include "collector/webdriver_client.hpp"

using namespace std::chrono_literals;

namespace {

struct Reply {
    int         status{200};
    std::string body{R"({"value": null})"};
};

// 回环上的最小 HTTP 服务，充当 chromedriver；每个连接只处理一个请求
class FakeDriverServer {
public:
    using Handler = std::function<Reply(const std::string& method, const std::string& path)>;

    explicit FakeDriverServer(Handler handler) : handler_(std::move(handler))
    {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0) throw std::runtime_error("socket failed");

        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        socklen_t len = sizeof(addr);
        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0 ||
            ::listen(listenFd_, 8) != 0) {
            ::close(listenFd_);
            throw std::runtime_error("cannot listen on loopback");
        }
        port_   = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serve(); });
    }

    ~FakeDriverServer()
    {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        ::close(listenFd_);
    }

    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }

    // "METHOD /path"，按到达顺序
    std::vector<std::string> requests() const
    {
        std::lock_guard lg(m_);
        return requests_;
    }

private:
    void serve()
    {
        while (!stop_) {
            pollfd pfd{listenFd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            int fd = ::accept(listenFd_, nullptr, nullptr);
            if (fd < 0) continue;
            handle(fd);
            ::close(fd);
        }
    }

    bool readMore(int fd, std::string& buf)
    {
        pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, 2000) <= 0) return false;
        char chunk[4096];
        auto n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return false;
        buf.append(chunk, static_cast<std::size_t>(n));
        return true;
    }

    void sendAll(int fd, const std::string& data)
    {
        std::size_t off = 0;
        while (off < data.size()) {
            auto n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            if (n <= 0) return;     // 客户端已超时断开
            off += static_cast<std::size_t>(n);
        }
    }

    void handle(int fd)
    {
        std::string buf;
        std::size_t headerEnd;
        while ((headerEnd = buf.find("\r\n\r\n")) == std::string::npos) {
            if (!readMore(fd, buf)) return;
        }

        std::string head = buf.substr(0, headerEnd);
        std::string lower = head;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::size_t contentLength = 0;
        auto cl = lower.find("content-length:");
        if (cl != std::string::npos) contentLength = std::stoul(head.substr(cl + 15));
        if (lower.find("expect: 100-continue") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 100 Continue\r\n\r\n");
        }
        while (buf.size() < headerEnd + 4 + contentLength) {
            if (!readMore(fd, buf)) return;
        }

        auto firstSpace  = head.find(' ');
        auto secondSpace = head.find(' ', firstSpace + 1);
        auto method = head.substr(0, firstSpace);
        auto path   = head.substr(firstSpace + 1, secondSpace - firstSpace - 1);
        {
            std::lock_guard lg(m_);
            requests_.push_back(method + " " + path);
        }

        auto reply = handler_(method, path);
        sendAll(fd, "HTTP/1.1 " + std::to_string(reply.status) + (reply.status == 200 ? " OK" : " Error") +
                    "\r\nContent-Type: application/json; charset=utf-8"
                    "\r\nContent-Length: " + std::to_string(reply.body.size()) +
                    "\r\nConnection: close\r\n\r\n" + reply.body);
    }

    Handler                  handler_;
    int                      listenFd_{-1};
    std::uint16_t            port_{0};
    std::atomic<bool>        stop_{false};
    std::thread              thread_;
    mutable std::mutex       m_;
    std::vector<std::string> requests_;
};

// 新建会话返回 s-1，其余请求按 page 决定
FakeDriverServer::Handler driverServing(std::function<Reply(const std::string& path)> page)
{
    return [page](const std::string& method, const std::string& path) {
        if (method == "POST" && path == "/session") {
            return Reply{200, R"({"value": {"sessionId": "s-1", "capabilities": {"browserName": "chrome"}}})"};
        }
        if (method == "DELETE") return Reply{};
        return page(path);
    };
}

bool contains(const std::vector<std::string>& v, const std::string& item)
{
    return std::find(v.begin(), v.end(), item) != v.end();
}

scrape_collector::Options fastOptions()
{
    scrape_collector::Options opt;
    opt.waitCeiling  = 300ms;
    opt.pollInterval = 30ms;
    return opt;
}

class WebDriverSessionTest : public ::testing::Test {
protected:
    static void SetUpTestSuite()    { curl_global_init(CURL_GLOBAL_ALL); }
    static void TearDownTestSuite() { curl_global_cleanup(); }
};

} // namespace

TEST_F(WebDriverSessionTest, CeilingExpiryStillDeletesTheSession)
{
    FakeDriverServer server(driverServing([](const std::string& path) {
        if (path == "/session/s-1/execute/sync") {
            return Reply{200, R"({"value": {"ready": "loading", "blocks": []}})"};
        }
        return Reply{};
    }));

    {
        scrape_collector::ScrapeCollector collector(
            std::make_shared<webdriver::WebDriverClient>(server.baseUrl() + "/", std::vector<std::string>{}),
            fastOptions());
        auto result = collector.collect("10.0.0.5", "Pine");
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error->kind, ErrorKind::ConnectivityTimeout);
    }

    auto seen = server.requests();
    ASSERT_GE(seen.size(), 5u);
    EXPECT_EQ(seen.front(), "POST /session");
    EXPECT_TRUE(contains(seen, "POST /session/s-1/timeouts"));
    EXPECT_TRUE(contains(seen, "POST /session/s-1/url"));
    EXPECT_TRUE(contains(seen, "POST /session/s-1/execute/sync"));
    EXPECT_EQ(seen.back(), "DELETE /session/s-1");
    EXPECT_EQ(std::count(seen.begin(), seen.end(), "DELETE /session/s-1"), 1);
}

TEST_F(WebDriverSessionTest, NavigationFailureStillDeletesTheSession)
{
    FakeDriverServer server(driverServing([](const std::string& path) {
        if (path == "/session/s-1/url") {
            return Reply{500, R"({"value": {"error": "unknown error",
                                            "message": "unknown error: net::ERR_CONNECTION_REFUSED"}})"};
        }
        return Reply{};
    }));

    webdriver::WebDriverClient client(server.baseUrl(), {"--headless=new"});
    scrape_collector::ScrapeCollector collector(
        std::shared_ptr<BrowserDriver>(&client, [](BrowserDriver*) {}), fastOptions());
    auto result = collector.collect("10.0.0.9", "Oak");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::ConnectivityTimeout);

    auto seen = server.requests();
    EXPECT_FALSE(contains(seen, "POST /session/s-1/execute/sync"));
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), "DELETE /session/s-1");
}

TEST_F(WebDriverSessionTest, SuccessfulScrapeDeletesTheSession)
{
    FakeDriverServer server(driverServing([](const std::string& path) {
        if (path == "/session/s-1/execute/sync") {
            return Reply{200, R"({"value": {"ready": "complete",
                                            "blocks": ["array current\n84 V", "array voltage\n12.1 V"]}})"};
        }
        return Reply{};
    }));

    scrape_collector::ScrapeCollector collector(
        std::make_shared<webdriver::WebDriverClient>(server.baseUrl(), std::vector<std::string>{}),
        fastOptions());
    auto result = collector.collect("10.0.0.5", "Pine");
    ASSERT_TRUE(result.ok()) << result.error->message;
    ASSERT_EQ(result.fields.size(), 2u);
    EXPECT_EQ(result.fields[1].value, "12.1 V");

    auto seen = server.requests();
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), "DELETE /session/s-1");
}

TEST_F(WebDriverSessionTest, NewSessionTimeoutIsReportedWithoutRelease)
{
    // driver 迟迟不回应新建会话，超过 open 超时加请求余量
    FakeDriverServer server([](const std::string& method, const std::string&) {
        if (method == "POST") std::this_thread::sleep_for(3s);
        return Reply{200, R"({"value": {"sessionId": "late", "capabilities": {}}})"};
    });

    webdriver::WebDriverClient client(server.baseUrl(), {});
    try {
        client.open(50ms);
        FAIL() << "expected CollectError";
    } catch (const CollectError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProtocolError);
        EXPECT_NE(std::string(e.what()).find("may be left running"), std::string::npos);
    }
    EXPECT_EQ(server.requests(), (std::vector<std::string>{"POST /session"}));
}
