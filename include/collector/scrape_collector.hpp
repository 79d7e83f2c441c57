#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "collector/browser_driver.hpp"
#include "collector/collector_type.h"
#include "collector/icollector.h"

namespace scrape_collector {

struct Options {
    std::chrono::milliseconds waitCeiling{45000};    // 从开始导航算起
    std::chrono::milliseconds pollInterval{500};
    std::string               blockSelector{".tile-text"};
    std::string               scheme{"http"};
    std::string               path{"/"};
    std::size_t               expectedBlocks{2};
};

// 拆行：去掉 \r 与空行
std::vector<std::string> splitLines(const std::string& text);

// 两个区块依次拼接后，取下标 1,3,5... 的值行
std::vector<std::string> interleaveValues(const std::vector<std::string>& blocks);

class ScrapeCollector : public ICollector {
public:
    ScrapeCollector();
    ScrapeCollector(std::shared_ptr<BrowserDriver> driver, Options opt);

    bool init(const Config& config, const DeviceSchema& schema) override;
    CollectResult collect(const std::string& address, const std::string& site) override;
    void deinit() noexcept override;
    DeviceKind kind() const override { return DeviceKind::Scrape; }

    const Options& options() const { return opt_; }

private:
    std::vector<RawField> impl_collect(const std::string& address, const std::string& site);
    std::vector<std::string> waitForBlocks(BrowserSession& session,
                                           std::chrono::steady_clock::time_point deadline,
                                           const std::string& site);

    std::shared_ptr<BrowserDriver> driver_;
    Options                        opt_;
};

} // namespace scrape_collector
