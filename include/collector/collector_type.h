#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#define DEVICE_KIND_SCRAPE "scrape"
#define DEVICE_KIND_QUERY  "query"

enum class DeviceKind {
    Scrape,     // 浏览器渲染页面后抓取文本
    Query,      // SNMP 结构化查询
    Unknown     // 配置中出现但没有对应采集器
};

// 采集/配置错误分类
enum class ErrorKind {
    ConnectivityTimeout,    // 设备不可达或等待超时
    ProtocolError,          // 设备可达但响应异常
    StructureError,         // 响应中缺少预期内容
    ParseError,             // 单个字段无法转换为数值
    ConfigurationError      // 未知设备类型、未注册指标
};

const char* toString(DeviceKind kind);
const char* toString(ErrorKind kind);
DeviceKind  parseDeviceKind(const std::string& name);

// 采集器返回的原始字段
struct RawField {
    std::size_t index{};    // 在采集结果中的位置
    std::string name;       // query 采集器填写对象名；scrape 为空，由位置 schema 决定
    std::string value;      // 未解析的原始文本
};

struct PollError {
    ErrorKind   kind{ErrorKind::ProtocolError};
    std::string message;
};

struct CollectResult {
    std::vector<RawField>    fields;
    std::optional<PollError> error;

    bool ok() const { return !error.has_value(); }

    static CollectResult success(std::vector<RawField> fields) {
        return CollectResult{std::move(fields), std::nullopt};
    }
    static CollectResult failure(ErrorKind kind, std::string message) {
        return CollectResult{{}, PollError{kind, std::move(message)}};
    }
};

// 采集器内部使用的异常，在 collect() 边界转换为 CollectResult
class CollectError : public std::runtime_error {
public:
    CollectError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};
