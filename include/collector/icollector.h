// icollector.h
#pragma once
#include <string>
#include "collector_type.h"
#include "common/config.hpp"
#include "common/metric_schema.hpp"

class ICollector {
public:
    virtual ~ICollector() = default;

    // 生命周期
    virtual bool init(const Config& config, const DeviceSchema& schema) = 0;   // 返回 false 表示失败
    // 单次采集：错误在这里分类并返回，不向外抛出；资源只在本次调用内持有
    virtual CollectResult collect(const std::string& address,
                                  const std::string& site)             = 0;
    virtual void deinit() noexcept                                      = 0;

    virtual DeviceKind kind() const = 0;
};
