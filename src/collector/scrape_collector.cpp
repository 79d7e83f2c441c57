#include "collector/scrape_collector.hpp"
#include "collector/collector_registry.hpp"
#include "collector/webdriver_client.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace scrape_collector {

using Clock = std::chrono::steady_clock;

namespace {

std::chrono::milliseconds remaining(Clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // namespace

std::vector<std::string> splitLines(const std::string& text)
{
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto nl = text.find('\n', pos);
        auto line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") != std::string::npos) lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return lines;
}

std::vector<std::string> interleaveValues(const std::vector<std::string>& blocks)
{
    std::vector<std::string> all;
    for (const auto& block : blocks) {
        auto lines = splitLines(block);
        all.insert(all.end(), lines.begin(), lines.end());
    }
    // 标签行与数值行交替出现，只保留数值行
    std::vector<std::string> values;
    for (std::size_t i = 1; i < all.size(); i += 2) values.push_back(all[i]);
    return values;
}

ScrapeCollector::ScrapeCollector() = default;

ScrapeCollector::ScrapeCollector(std::shared_ptr<BrowserDriver> driver, Options opt)
    : driver_(std::move(driver)), opt_(std::move(opt))
{
}

bool ScrapeCollector::init(const Config& config, const DeviceSchema& schema)
{
    const std::string section = "scrape_collector";
    opt_.waitCeiling   = std::chrono::seconds(config.getIntOr(section, "wait_ceiling_seconds", 45));
    opt_.pollInterval  = std::chrono::milliseconds(config.getIntOr(section, "poll_interval_ms", 500));
    opt_.blockSelector = config.getStringOr(section, "block_selector", opt_.blockSelector);
    opt_.scheme        = config.getStringOr(section, "scheme", opt_.scheme);
    opt_.path          = config.getStringOr(section, "path", opt_.path);

    if (opt_.waitCeiling.count() <= 0 || opt_.pollInterval.count() <= 0) {
        spdlog::error("ScrapeCollector: wait_ceiling_seconds and poll_interval_ms must be positive");
        return false;
    }

    if (!driver_) {
        std::vector<std::string> args = {"--headless=new", "--no-sandbox", "--disable-gpu"};
        if (config.has(section, "browser_args")) {
            args = config.getArray<std::string>(section, "browser_args");
        }
        auto url = config.getStringOr(section, "webdriver_url", "http://127.0.0.1:9515");
        driver_ = std::make_shared<webdriver::WebDriverClient>(url, std::move(args));
    }

    spdlog::info("ScrapeCollector init: selector='{}' ceiling={}ms poll={}ms, {} schema fields",
                 opt_.blockSelector, opt_.waitCeiling.count(), opt_.pollInterval.count(),
                 schema.fields.size());
    return true;
}

CollectResult ScrapeCollector::collect(const std::string& address, const std::string& site)
{
    try {
        return CollectResult::success(impl_collect(address, site));
    } catch (const CollectError& e) {
        return CollectResult::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        return CollectResult::failure(ErrorKind::ProtocolError, e.what());
    }
}

std::vector<RawField> ScrapeCollector::impl_collect(const std::string& address, const std::string& site)
{
    if (!driver_) {
        throw CollectError(ErrorKind::ConfigurationError, "scrape collector used before init");
    }

    // session 离开作用域即释放，异常路径同样成立
    auto session = driver_->open(opt_.waitCeiling);

    const auto deadline = Clock::now() + opt_.waitCeiling;
    const auto url = fmt::format("{}://{}{}", opt_.scheme, address, opt_.path);
    spdlog::debug("ScrapeCollector: {} navigating to {}", site, url);
    session->navigate(url, remaining(deadline));

    auto blocks = waitForBlocks(*session, deadline, site);
    auto values = interleaveValues(blocks);

    std::vector<RawField> fields;
    fields.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        fields.push_back(RawField{i, {}, std::move(values[i])});
    }
    spdlog::debug("ScrapeCollector: {} got {} value lines from {}", site, fields.size(), url);
    return fields;
}

std::vector<std::string> ScrapeCollector::waitForBlocks(BrowserSession& session,
                                                        Clock::time_point deadline,
                                                        const std::string& site)
{
    PageProbe last;
    std::size_t present = 0;
    while (Clock::now() < deadline) {
        last = session.probe(opt_.blockSelector, remaining(deadline));

        std::vector<std::string> filled;
        for (const auto& block : last.blocks) {
            if (!splitLines(block).empty()) filled.push_back(block);
        }
        present = filled.size();
        if (present >= opt_.expectedBlocks) {
            filled.resize(opt_.expectedBlocks);
            return filled;
        }

        auto pause = std::min(opt_.pollInterval, remaining(deadline));
        if (pause.count() <= 0) break;
        std::this_thread::sleep_for(pause);
    }

    if (last.loaded) {
        throw CollectError(ErrorKind::StructureError,
                           fmt::format("page loaded but only {} of {} '{}' blocks present",
                                       present, opt_.expectedBlocks, opt_.blockSelector));
    }
    spdlog::debug("ScrapeCollector: {} page still loading when the ceiling expired", site);
    throw CollectError(ErrorKind::ConnectivityTimeout,
                       fmt::format("content not ready after {}ms", opt_.waitCeiling.count()));
}

void ScrapeCollector::deinit() noexcept {
    driver_.reset();
    spdlog::info("ScrapeCollector deinit");
}

namespace {
    static AutoReg<ScrapeCollector> _auto_reg(DeviceKind::Scrape);   // 全局对象，构造函数在 main() 前执行
}

} // namespace scrape_collector
