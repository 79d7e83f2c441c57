#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "collector/collector_type.h"
#include "collector/icollector.h"
#include "collector/snmp_codec.hpp"
#include "collector/udp_transport.hpp"

namespace query_collector {

struct Options {
    std::string               community{"public"};
    std::uint16_t             port{161};
    std::chrono::milliseconds timeout{2000};   // 单次请求等待
    int                       retries{2};      // 首次之外的重发次数
    std::vector<QueryObject>  objects;         // 按请求顺序
};

// SNMPv2c GET 采集器：每次采集打开一个 socket，超时 × (retries + 1) 为上限
class QueryCollector : public ICollector {
public:
    QueryCollector();
    QueryCollector(TransportFactory transport, Options opt);

    bool init(const Config& config, const DeviceSchema& schema) override;
    CollectResult collect(const std::string& address, const std::string& site) override;
    void deinit() noexcept override;
    DeviceKind kind() const override { return DeviceKind::Query; }

    const Options& options() const { return opt_; }

private:
    std::vector<RawField> impl_collect(const std::string& address, const std::string& site);
    std::vector<RawField> pairValues(const snmp::Message& response, const std::string& site) const;

    TransportFactory          transport_;
    Options                   opt_;
    std::vector<std::string>  oids_;
    std::atomic<std::int32_t> nextRequestId_;
};

} // namespace query_collector
