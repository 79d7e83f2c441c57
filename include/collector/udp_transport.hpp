#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// 单次采集独占的数据报通道；析构即释放
class DatagramTransport {
public:
    virtual ~DatagramTransport() = default;

    virtual void send(const std::vector<std::uint8_t>& datagram) = 0;

    // 超时返回 std::nullopt；对端不可达等错误抛出 CollectError
    virtual std::optional<std::vector<std::uint8_t>> receive(std::chrono::milliseconds timeout) = 0;
};

using TransportFactory =
    std::function<std::unique_ptr<DatagramTransport>(const std::string& host, std::uint16_t port)>;

// connect() 过的 UDP socket，可以收到 ICMP 不可达
class UdpTransport : public DatagramTransport {
public:
    UdpTransport(const std::string& host, std::uint16_t port);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&)            = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    void send(const std::vector<std::uint8_t>& datagram) override;
    std::optional<std::vector<std::uint8_t>> receive(std::chrono::milliseconds timeout) override;

    static TransportFactory factory();

private:
    std::string peer_;
    int         fd_{-1};
};
