#include "collector/query_collector.hpp"
#include "collector/collector_registry.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace query_collector {

namespace {

std::int32_t initialRequestId()
{
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return static_cast<std::int32_t>(ticks & 0x3fffffff) + 1;
}

} // namespace

QueryCollector::QueryCollector()
    : nextRequestId_(initialRequestId())
{
}

QueryCollector::QueryCollector(TransportFactory transport, Options opt)
    : transport_(std::move(transport)),
      opt_(std::move(opt)),
      nextRequestId_(initialRequestId())
{
    for (const auto& obj : opt_.objects) oids_.push_back(obj.oid);
}

bool QueryCollector::init(const Config& config, const DeviceSchema& schema)
{
    const std::string section = "query_collector";
    opt_.community = config.getStringOr(section, "community", opt_.community);
    opt_.port      = static_cast<std::uint16_t>(config.getIntOr(section, "port", opt_.port));
    opt_.timeout   = std::chrono::milliseconds(
        config.getIntOr(section, "timeout_ms", static_cast<int>(opt_.timeout.count())));
    opt_.retries   = config.getIntOr(section, "retries", opt_.retries);
    opt_.objects   = schema.objects;

    if (opt_.retries < 0) {
        spdlog::warn("QueryCollector: negative retries {}, using 0", opt_.retries);
        opt_.retries = 0;
    }
    if (opt_.timeout.count() <= 0) {
        spdlog::error("QueryCollector: timeout_ms must be positive");
        return false;
    }
    if (opt_.objects.empty()) {
        spdlog::error("QueryCollector: query schema has no objects");
        return false;
    }

    oids_.clear();
    for (const auto& obj : opt_.objects) oids_.push_back(obj.oid);
    if (!transport_) transport_ = UdpTransport::factory();

    spdlog::info("QueryCollector init: {} objects, port={} timeout={}ms retries={}",
                 opt_.objects.size(), opt_.port, opt_.timeout.count(), opt_.retries);
    return true;
}

CollectResult QueryCollector::collect(const std::string& address, const std::string& site)
{
    try {
        return CollectResult::success(impl_collect(address, site));
    } catch (const CollectError& e) {
        return CollectResult::failure(e.kind(), e.what());
    } catch (const snmp::DecodeError& e) {
        return CollectResult::failure(ErrorKind::ProtocolError, fmt::format("malformed response: {}", e.what()));
    } catch (const std::exception& e) {
        return CollectResult::failure(ErrorKind::ProtocolError, e.what());
    }
}

std::vector<RawField> QueryCollector::impl_collect(const std::string& address, const std::string& site)
{
    if (!transport_) {
        throw CollectError(ErrorKind::ConfigurationError, "query collector used before init");
    }

    const auto requestId = nextRequestId_++;
    const auto request = snmp::encode(snmp::makeGetRequest(opt_.community, requestId, oids_));

    // socket 只活在本次采集内
    auto transport = transport_(address, opt_.port);
    const int attempts = opt_.retries + 1;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        transport->send(request);
        spdlog::trace("QueryCollector: {} request {} attempt {}/{}", site, requestId, attempt, attempts);

        const auto deadline = std::chrono::steady_clock::now() + opt_.timeout;
        for (;;) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) break;

            auto datagram = transport->receive(left);
            if (!datagram) break;

            auto response = snmp::decode(*datagram);
            if (response.pdu != snmp::PduType::Response || response.requestId != requestId) {
                // 之前请求的迟到响应，丢弃继续等
                spdlog::debug("QueryCollector: {} ignoring pdu 0x{:02x} with request id {}", site,
                              static_cast<unsigned>(response.pdu), response.requestId);
                continue;
            }
            if (response.errorStatus != 0) {
                throw CollectError(ErrorKind::ProtocolError,
                                   fmt::format("agent returned {} (index {})",
                                               snmp::errorStatusName(response.errorStatus),
                                               response.errorIndex));
            }
            return pairValues(response, site);
        }
        spdlog::debug("QueryCollector: {} {} no response within {}ms (attempt {}/{})",
                      site, address, opt_.timeout.count(), attempt, attempts);
    }

    throw CollectError(ErrorKind::ConnectivityTimeout,
                       fmt::format("no response from {} after {} attempts", address, attempts));
}

std::vector<RawField> QueryCollector::pairValues(const snmp::Message& response, const std::string& site) const
{
    if (response.varbinds.size() != opt_.objects.size()) {
        throw CollectError(ErrorKind::ProtocolError,
                           fmt::format("expected {} varbinds, got {}",
                                       opt_.objects.size(), response.varbinds.size()));
    }

    std::vector<RawField> fields;
    for (std::size_t i = 0; i < opt_.objects.size(); ++i) {
        const auto& obj = opt_.objects[i];
        const auto& vb = response.varbinds[i];
        if (snmp::formatOid(snmp::parseOid(vb.oid)) != snmp::formatOid(snmp::parseOid(obj.oid))) {
            throw CollectError(ErrorKind::ProtocolError,
                               fmt::format("varbind {} is {}, requested {}", i, vb.oid, obj.oid));
        }
        if (vb.value.isAbsent()) {
            spdlog::debug("QueryCollector: {} object {} ({}) has no value", site, obj.name, obj.oid);
            continue;
        }
        fields.push_back(RawField{i, obj.name, vb.value.toString()});
    }
    return fields;
}

void QueryCollector::deinit() noexcept {
    spdlog::info("QueryCollector deinit");
}

namespace {
    static AutoReg<QueryCollector> _auto_reg(DeviceKind::Query);   // 全局对象，构造函数在 main() 前执行
}

} // namespace query_collector
