#include "collector/webdriver_client.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace webdriver {

namespace {

// 会话外的请求余量，给 driver 自身处理留时间
constexpr std::chrono::milliseconds kRequestSlack{2000};
constexpr std::chrono::milliseconds kReleaseTimeout{10000};

const char* kProbeScript =
    "var nodes = document.querySelectorAll(arguments[0]);"
    "var out = [];"
    "for (var i = 0; i < nodes.length; i++) {"
    "  out.push(nodes[i].innerText || nodes[i].textContent || '');"
    "}"
    "return {ready: document.readyState, blocks: out};";

size_t collect_cb(char* ptr, size_t size, size_t n, void* userdata)
{
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * n);
    return size * n;
}

CURLcode perform(CURL* curl, const char* method, const std::string& url,
                 const std::string* body, std::chrono::milliseconds timeout,
                 std::string& response, long& status)
{
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);   // 多线程下超时不能依赖信号
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    struct curl_slist* hdrs = nullptr;
    if (body) {
        hdrs = curl_slist_append(hdrs, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode rc = curl_easy_perform(curl);
    curl_slist_free_all(hdrs);

    status = 0;
    if (rc == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    return rc;
}

} // namespace

/* ---------- 协议解析 ---------- */
ErrorKind classifyError(const std::string& error, const std::string& message)
{
    if (error == "timeout" || error == "script timeout") return ErrorKind::ConnectivityTimeout;
    if (error == "no such element") return ErrorKind::StructureError;
    if (message.find("net::ERR_") != std::string::npos) return ErrorKind::ConnectivityTimeout;
    return ErrorKind::ProtocolError;
}

json parseResponse(long httpStatus, const std::string& body, const char* what)
{
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw CollectError(ErrorKind::ProtocolError,
                           fmt::format("{}: http {} with unparsable body: {}", what, httpStatus, e.what()));
    }
    if (!j.is_object() || !j.contains("value")) {
        throw CollectError(ErrorKind::ProtocolError,
                           fmt::format("{}: http {} response has no 'value'", what, httpStatus));
    }

    const auto& value = j["value"];
    if (value.is_object() && value.contains("error")) {
        auto error   = value["error"].is_string() ? value["error"].get<std::string>() : std::string("unknown error");
        auto message = value.value("message", std::string());
        // 消息首行就够了，chromedriver 会附带很长的堆栈
        auto nl = message.find('\n');
        if (nl != std::string::npos) message.resize(nl);
        throw CollectError(classifyError(error, message),
                           fmt::format("{}: {} ({})", what, error, message));
    }
    if (httpStatus != 200) {
        throw CollectError(ErrorKind::ProtocolError, fmt::format("{}: unexpected http {}", what, httpStatus));
    }
    return j;
}

std::string sessionIdFrom(const json& response)
{
    const auto& value = response["value"];
    if (value.is_object() && value.contains("sessionId") && value["sessionId"].is_string()) {
        return value["sessionId"].get<std::string>();
    }
    // 旧版 JSON Wire 协议把 sessionId 放在顶层
    if (response.contains("sessionId") && response["sessionId"].is_string()) {
        return response["sessionId"].get<std::string>();
    }
    throw CollectError(ErrorKind::ProtocolError, "new session response carries no sessionId");
}

PageProbe probeFrom(const json& response)
{
    const auto& value = response["value"];
    if (!value.is_object()) {
        throw CollectError(ErrorKind::ProtocolError, "probe script returned a non-object");
    }
    PageProbe probe;
    probe.loaded = value.value("ready", std::string()) == "complete";
    if (value.contains("blocks") && value["blocks"].is_array()) {
        for (const auto& b : value["blocks"]) {
            probe.blocks.push_back(b.is_string() ? b.get<std::string>() : std::string());
        }
    }
    return probe;
}

json newSessionPayload(const std::vector<std::string>& browserArgs)
{
    json caps;
    caps["browserName"] = "chrome";
    caps["pageLoadStrategy"] = "normal";
    caps["goog:chromeOptions"]["args"] = browserArgs;
    json payload;
    payload["capabilities"]["alwaysMatch"] = caps;
    return payload;
}

json probePayload(const std::string& selector)
{
    json payload;
    payload["script"] = kProbeScript;
    payload["args"] = json::array({selector});
    return payload;
}

/* ---------- 会话 ---------- */
WebDriverSession::WebDriverSession(std::string baseUrl, std::string sessionId, CurlHandle curl)
    : baseUrl_(std::move(baseUrl)), sessionId_(std::move(sessionId)), curl_(std::move(curl))
{
}

WebDriverSession::~WebDriverSession()
{
    std::string response;
    long status = 0;
    auto url = fmt::format("{}/session/{}", baseUrl_, sessionId_);
    CURLcode rc = perform(curl_.get(), "DELETE", url, nullptr, kReleaseTimeout, response, status);
    if (rc != CURLE_OK) {
        spdlog::error("WebDriverSession: release of session {} failed: {}", sessionId_, curl_easy_strerror(rc));
    } else if (status != 200) {
        spdlog::warn("WebDriverSession: release of session {} answered http {}", sessionId_, status);
    } else {
        spdlog::debug("WebDriverSession: session {} released", sessionId_);
    }
}

json WebDriverSession::call(const char* method, const std::string& path,
                            const json* body, std::chrono::milliseconds timeout)
{
    std::string payload = body ? body->dump() : std::string();
    std::string response;
    long status = 0;
    auto url = fmt::format("{}/session/{}{}", baseUrl_, sessionId_, path);
    CURLcode rc = perform(curl_.get(), method, url, body ? &payload : nullptr,
                          timeout + kRequestSlack, response, status);
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        throw CollectError(ErrorKind::ConnectivityTimeout,
                           fmt::format("{} {} timed out after {}ms", method, path, timeout.count()));
    }
    if (rc != CURLE_OK) {
        throw CollectError(ErrorKind::ProtocolError,
                           fmt::format("webdriver request {} {} failed: {}", method, path, curl_easy_strerror(rc)));
    }
    return parseResponse(status, response, path.c_str());
}

void WebDriverSession::navigate(const std::string& url, std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0) {
        throw CollectError(ErrorKind::ConnectivityTimeout, "no time left to navigate");
    }
    json timeouts;
    timeouts["pageLoad"] = timeout.count();
    timeouts["script"]   = timeout.count();
    call("POST", "/timeouts", &timeouts, kRequestSlack);

    json target;
    target["url"] = url;
    call("POST", "/url", &target, timeout);
}

PageProbe WebDriverSession::probe(const std::string& selector, std::chrono::milliseconds timeout)
{
    auto payload = probePayload(selector);
    return probeFrom(call("POST", "/execute/sync", &payload, timeout));
}

/* ---------- 客户端 ---------- */
WebDriverClient::WebDriverClient(std::string baseUrl, std::vector<std::string> browserArgs)
    : baseUrl_(std::move(baseUrl)), browserArgs_(std::move(browserArgs))
{
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
    spdlog::info("WebDriverClient: using driver at {}", baseUrl_);
}

std::unique_ptr<BrowserSession> WebDriverClient::open(std::chrono::milliseconds timeout)
{
    CurlHandle curl(curl_easy_init());
    if (!curl) throw CollectError(ErrorKind::ProtocolError, "curl_easy_init failed");

    const auto payload = newSessionPayload(browserArgs_).dump();
    std::string response;
    long status = 0;
    CURLcode rc = perform(curl.get(), "POST", baseUrl_ + "/session", &payload,
                          timeout + kRequestSlack, response, status);
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        // 此时 driver 可能仍在启动浏览器，拿不到 sessionId 就无法 DELETE
        spdlog::warn("WebDriverClient: new session at {} timed out, the driver may still start a browser "
                     "that will not be released", baseUrl_);
        throw CollectError(ErrorKind::ProtocolError,
                           fmt::format("new session at {} timed out after {}ms, a browser may be left running",
                                       baseUrl_, (timeout + kRequestSlack).count()));
    }
    if (rc != CURLE_OK) {
        throw CollectError(ErrorKind::ProtocolError,
                           fmt::format("webdriver at {} unavailable: {}", baseUrl_, curl_easy_strerror(rc)));
    }

    auto id = sessionIdFrom(parseResponse(status, response, "new session"));
    spdlog::debug("WebDriverClient: opened session {}", id);
    return std::make_unique<WebDriverSession>(baseUrl_, std::move(id), std::move(curl));
}

} // namespace webdriver
