// collector_registry.cpp
#include "collector/collector_registry.hpp"
#include "collector/collector_type.h"

CollectorRegistry& CollectorRegistry::instance() {
    static CollectorRegistry reg;
    return reg;
}

std::unique_ptr<ICollector> CollectorRegistry::createCollector(DeviceKind kind) const {
    auto it = factories_.find(kind);
    if (it == factories_.end())
        return nullptr;                // 调用方可判空
    return it->second();
}

std::vector<DeviceKind> CollectorRegistry::list() const {
    std::vector<DeviceKind> out;
    for (const auto& [k, _] : factories_) out.push_back(k);
    return out;
}
