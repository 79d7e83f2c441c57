#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <string>

#include "sink/metric_catalog.hpp"
#include "sink/metric_sink.hpp"

// 写入 prometheus gauge；目录只读，Gauge::Set 本身是原子的，所以这里无需加锁
class PrometheusSink : public IMetricSink {
public:
    explicit PrometheusSink(const MetricCatalog& catalog);

    bool publish(const std::string& name, double value) override;

    std::size_t published() const { return published_.load(); }
    std::size_t rejected() const { return rejected_.load(); }

private:
    const MetricCatalog&     catalog_;
    std::atomic<std::size_t> published_{0};
    std::atomic<std::size_t> rejected_{0};
};
