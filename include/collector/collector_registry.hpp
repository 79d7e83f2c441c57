// collector_registry.h
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <vector>
#include "icollector.h"

class CollectorRegistry {
public:
    // 单例（可选）；也可 main() 手动构造
    static CollectorRegistry& instance();

    // 注册模板：把任意类型 T 登记到 kind 名下
    template <typename T>
    void registerCollector(DeviceKind kind) {
        factories_[kind] = []() -> std::unique_ptr<ICollector> {
            return std::make_unique<T>();
        };
    }

    // 工厂：根据设备类型生成一个未初始化的采集器
    // 返回 nullptr 表示该类型没有采集器
    std::unique_ptr<ICollector> createCollector(DeviceKind kind) const;

    // 列举已注册采集器（调试用）
    std::vector<DeviceKind> list() const;

private:
    using Factory = std::function<std::unique_ptr<ICollector>()>;

    CollectorRegistry() = default;
    std::map<DeviceKind, Factory> factories_;
};

template <typename T>
struct AutoReg {
    explicit AutoReg(DeviceKind kind) {
        CollectorRegistry::instance().registerCollector<T>(kind);
    }
};
