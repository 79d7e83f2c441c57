#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <map>
#include <set>
#include <string>
#include <vector>

#include "collector/collector_type.h"
#include "common/config.hpp"

// 发布名：{site}_{suffix}
std::string canonicalName(const std::string& site, const std::string& suffix);

struct QueryObject {
    std::string name;   // 指标后缀
    std::string oid;    // 点分数字形式
};

// 设备类型 -> 有序指标后缀
struct DeviceSchema {
    DeviceKind               kind{DeviceKind::Unknown};
    std::vector<std::string> fields;    // scrape: 按位置对应的值行；query: 与 objects 同序
    std::vector<QueryObject> objects;   // 仅 query 使用
    std::vector<std::string> exclude;   // 离散状态码等非测量字段

    // 某站点下被排除的完整指标名
    std::set<std::string> exclusionSet(const std::string& site) const;

    // 实际会发布的后缀（fields 去掉 exclude）
    std::vector<std::string> publishedFields() const;
};

class SchemaSet {
public:
    // 读取 [schemas]，结构错误抛出 std::runtime_error
    static SchemaSet load(const Config& config);

    void add(DeviceSchema schema);
    const DeviceSchema* find(DeviceKind kind) const;
    bool empty() const { return schemas_.empty(); }

    // 对照指标目录检查，返回发现的问题（不抛出）
    std::vector<std::string> validateAgainst(const std::set<std::string>& catalogSuffixes) const;

private:
    static void check(const DeviceSchema& schema);

    std::map<DeviceKind, DeviceSchema> schemas_;
};
