#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "collector/browser_driver.hpp"
#include "collector/collector_type.h"

// W3C WebDriver 客户端（chromedriver / geckodriver），走 libcurl
namespace webdriver {

struct CurlDeleter {
    void operator()(CURL* h) const noexcept { if (h) curl_easy_cleanup(h); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

// 按 W3C 错误码和消息归类；net::ERR_* 视为设备不可达
ErrorKind classifyError(const std::string& error, const std::string& message);

// 以下解析失败均抛出 CollectError(ProtocolError)
nlohmann::json parseResponse(long httpStatus, const std::string& body, const char* what);
std::string    sessionIdFrom(const nlohmann::json& response);
PageProbe      probeFrom(const nlohmann::json& response);

nlohmann::json newSessionPayload(const std::vector<std::string>& browserArgs);
nlohmann::json probePayload(const std::string& selector);

class WebDriverSession : public BrowserSession {
public:
    WebDriverSession(std::string baseUrl, std::string sessionId, CurlHandle curl);
    ~WebDriverSession() override;   // DELETE /session/{id}

    WebDriverSession(const WebDriverSession&)            = delete;
    WebDriverSession& operator=(const WebDriverSession&) = delete;

    void navigate(const std::string& url, std::chrono::milliseconds timeout) override;
    PageProbe probe(const std::string& selector, std::chrono::milliseconds timeout) override;

    const std::string& id() const { return sessionId_; }

private:
    nlohmann::json call(const char* method, const std::string& path,
                        const nlohmann::json* body, std::chrono::milliseconds timeout);

    std::string baseUrl_;
    std::string sessionId_;
    CurlHandle  curl_;
};

class WebDriverClient : public BrowserDriver {
public:
    WebDriverClient(std::string baseUrl, std::vector<std::string> browserArgs);

    std::unique_ptr<BrowserSession> open(std::chrono::milliseconds timeout) override;

private:
    std::string              baseUrl_;
    std::vector<std::string> browserArgs_;
};

} // namespace webdriver
