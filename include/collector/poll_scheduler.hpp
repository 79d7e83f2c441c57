#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "collector/collector_type.h"
#include "collector/icollector.h"
#include "common/inventory.hpp"
#include "common/metric_schema.hpp"
#include "common/timer_scheduler.hpp"
#include "sink/metric_sink.hpp"

// 单台设备一次采集的结果，只用于日志
struct PollOutcome {
    std::string               site;
    std::string               device;
    DeviceKind                kind{DeviceKind::Unknown};
    bool                      success{false};
    std::optional<PollError>  error;
    std::chrono::milliseconds elapsed{0};
    std::size_t               fields{0};      // 采集器返回的原始字段数
    std::size_t               published{0};   // 实际写入 sink 的指标数
};

struct CycleReport {
    std::vector<PollOutcome>  outcomes;       // 与清单顺序一致
    std::chrono::milliseconds elapsed{0};

    std::size_t succeeded() const;
    std::size_t failed() const;
    std::size_t published() const;
};

using CollectorMap = std::map<DeviceKind, std::unique_ptr<ICollector>>;

// 按清单顺序逐台采集；一轮结束后固定间隔 cadence 再开始下一轮
// 间隔从上一轮结束算起，慢设备会拉长实际周期
class PollScheduler {
public:
    PollScheduler(Inventory inventory,
                  SchemaSet schemas,
                  CollectorMap collectors,
                  IMetricSink& sink,
                  std::chrono::milliseconds cadence);
    ~PollScheduler();

    PollScheduler(const PollScheduler&)            = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    // 同步执行一轮
    CycleReport runCycle();

    // 启动周期任务后阻塞，直到 shutdown()
    void runForever();

    // 非阻塞启动：立即排入第一轮
    void start();

    // 取消下一轮，等待当前轮结束
    void shutdown();

    std::size_t cyclesCompleted() const { return cycles_.load(); }
    const Inventory& inventory() const { return inventory_; }

private:
    PollOutcome pollDevice(const Site& site, const Device& device);
    void scheduleNext(TimerScheduler::Duration delay);
    void logOutcome(const PollOutcome& outcome) const;

    Inventory                 inventory_;
    SchemaSet                 schemas_;
    CollectorMap              collectors_;
    IMetricSink&              sink_;
    std::chrono::milliseconds cadence_;

    // 站点 -> 设备类型 -> 被排除的完整名
    std::map<std::string, std::map<DeviceKind, std::set<std::string>>> exclusions_;

    TimerScheduler           timer_{1};
    std::atomic<bool>        running_{false};
    std::atomic<bool>        stopRequested_{false};
    std::atomic<std::size_t> cycles_{0};
    std::mutex               m_;
    std::condition_variable  stopped_;
};
