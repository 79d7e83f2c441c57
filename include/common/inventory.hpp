#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <string>
#include <vector>

#include "collector/collector_type.h"
#include "common/config.hpp"

struct Device {
    std::string name;
    DeviceKind  kind{DeviceKind::Unknown};
    std::string kindName;   // 配置中的原始写法，用于日志
    std::string address;
};

struct Site {
    std::string         id;
    std::vector<Device> devices;   // 保持配置顺序
};

// 站点清单：启动时加载一次，运行期间只读
class Inventory {
public:
    Inventory() = default;
    explicit Inventory(std::vector<Site> sites);

    // 读取 [inventory][sites]，站点 id 重复或不合法时抛出 std::runtime_error
    static Inventory load(const Config& config);

    const std::vector<Site>& sites() const { return sites_; }
    std::size_t deviceCount() const;
    bool empty() const { return sites_.empty(); }

    // 站点 id 会成为指标名前缀，必须满足 [a-zA-Z_:][a-zA-Z0-9_:]*
    static bool isValidSiteId(const std::string& id);

private:
    void validate() const;

    std::vector<Site> sites_;
};
