#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include "common/config.hpp"
#include "common/inventory.hpp"
#include "common/metric_schema.hpp"

struct CatalogEntry {
    std::string suffix;
    std::string help;
};

// 规范名 -> prometheus gauge；首轮采集前建好，之后只读
class MetricCatalog {
public:
    explicit MetricCatalog(std::shared_ptr<prometheus::Registry> registry);

    // 读取 [metric_catalog][metrics]
    static std::vector<CatalogEntry> loadEntries(const Config& config);

    // 按站点实际拥有的设备类型注册 {site}_{suffix}；schema 中不在目录里的字段跳过并返回
    std::vector<std::string> registerSites(const Inventory& inventory,
                                           const SchemaSet& schemas,
                                           const std::vector<CatalogEntry>& entries);

    // 单个注册，名字重复时返回已有 gauge
    prometheus::Gauge& add(const std::string& name, const std::string& help);

    prometheus::Gauge* find(const std::string& name) const;
    std::size_t size() const { return gauges_.size(); }
    std::vector<std::string> names() const;

    const std::shared_ptr<prometheus::Registry>& registry() const { return registry_; }

private:
    std::shared_ptr<prometheus::Registry>               registry_;
    std::unordered_map<std::string, prometheus::Gauge*> gauges_;
};
