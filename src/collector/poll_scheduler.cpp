#include "collector/poll_scheduler.hpp"
#include "collector/reading_normalizer.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using Clock = std::chrono::steady_clock;

namespace {

std::chrono::milliseconds since(Clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

std::size_t CycleReport::succeeded() const
{
    std::size_t n = 0;
    for (const auto& o : outcomes) n += o.success ? 1 : 0;
    return n;
}

std::size_t CycleReport::failed() const
{
    return outcomes.size() - succeeded();
}

std::size_t CycleReport::published() const
{
    std::size_t n = 0;
    for (const auto& o : outcomes) n += o.published;
    return n;
}

PollScheduler::PollScheduler(Inventory inventory,
                             SchemaSet schemas,
                             CollectorMap collectors,
                             IMetricSink& sink,
                             std::chrono::milliseconds cadence)
    : inventory_(std::move(inventory)),
      schemas_(std::move(schemas)),
      collectors_(std::move(collectors)),
      sink_(sink),
      cadence_(cadence)
{
    if (cadence_.count() <= 0) {
        // 没有间隔的话各轮会首尾相连地空转
        throw std::invalid_argument(fmt::format("PollScheduler: cadence must be positive, got {} ms",
                                                cadence_.count()));
    }
    for (const auto& site : inventory_.sites()) {
        for (const auto& dev : site.devices) {
            const auto* schema = schemas_.find(dev.kind);
            if (schema) exclusions_[site.id][dev.kind] = schema->exclusionSet(site.id);
        }
    }
    spdlog::info("PollScheduler: {} sites, {} devices, {} collectors, cadence {} ms",
                 inventory_.sites().size(), inventory_.deviceCount(), collectors_.size(),
                 cadence_.count());
}

PollScheduler::~PollScheduler()
{
    shutdown();
    for (auto& [kind, collector] : collectors_) {
        if (collector) collector->deinit();
    }
}

CycleReport PollScheduler::runCycle()
{
    CycleReport report;
    const auto start = Clock::now();
    const auto cycle = cycles_.load() + 1;

    for (const auto& site : inventory_.sites()) {
        for (const auto& device : site.devices) {
            if (stopRequested_) {
                spdlog::info("PollScheduler: cycle {} interrupted by shutdown", cycle);
                report.elapsed = since(start);
                return report;
            }
            report.outcomes.push_back(pollDevice(site, device));
        }
    }

    report.elapsed = since(start);
    ++cycles_;
    spdlog::info("PollScheduler: cycle {} done in {} ms: {} ok, {} failed, {} metrics published",
                 cycle, report.elapsed.count(), report.succeeded(), report.failed(), report.published());
    return report;
}

PollOutcome PollScheduler::pollDevice(const Site& site, const Device& device)
{
    PollOutcome out;
    out.site   = site.id;
    out.device = device.name;
    out.kind   = device.kind;
    const auto start = Clock::now();

    auto it = collectors_.find(device.kind);
    const auto* schema = schemas_.find(device.kind);
    if (it == collectors_.end() || !it->second || !schema) {
        out.error = PollError{ErrorKind::ConfigurationError,
                              fmt::format("no {} for device kind '{}'",
                                          schema ? "collector" : "schema", device.kindName)};
        logOutcome(out);
        return out;
    }

    try {
        auto result = it->second->collect(device.address, site.id);
        out.elapsed = since(start);
        if (!result.ok()) {
            out.error = result.error;
        } else {
            out.fields = result.fields.size();

            static const std::set<std::string> kNone;
            const std::set<std::string>* excluded = &kNone;
            auto siteIt = exclusions_.find(site.id);
            if (siteIt != exclusions_.end()) {
                auto kindIt = siteIt->second.find(device.kind);
                if (kindIt != siteIt->second.end()) excluded = &kindIt->second;
            }

            auto metrics = normalizer::normalize(site.id, result.fields, schema->fields, *excluded);
            for (const auto& [name, value] : metrics) {
                if (sink_.publish(name, value)) ++out.published;
            }
            out.success = true;
        }
    } catch (const std::exception& e) {
        // 采集器应当自己分类错误；漏出来的异常在这里兜住，不影响后续设备
        out.elapsed = since(start);
        out.success = false;
        out.error = PollError{ErrorKind::ProtocolError, fmt::format("unexpected exception: {}", e.what())};
    }

    logOutcome(out);
    return out;
}

void PollScheduler::logOutcome(const PollOutcome& o) const
{
    if (o.success) {
        spdlog::info("PollScheduler: {}/{} ({}) ok in {} ms, {} fields, {} published",
                     o.site, o.device, toString(o.kind), o.elapsed.count(), o.fields, o.published);
        return;
    }
    const auto kind = o.error ? o.error->kind : ErrorKind::ProtocolError;
    const auto msg  = o.error ? o.error->message : std::string("unknown failure");
    if (kind == ErrorKind::ConfigurationError) {
        spdlog::error("PollScheduler: {}/{} skipped: {}: {}", o.site, o.device, toString(kind), msg);
    } else {
        spdlog::warn("PollScheduler: {}/{} ({}) failed after {} ms: {}: {}",
                     o.site, o.device, toString(o.kind), o.elapsed.count(), toString(kind), msg);
    }
}

void PollScheduler::start()
{
    if (running_.exchange(true)) return;
    stopRequested_ = false;
    spdlog::info("PollScheduler: started");
    scheduleNext(TimerScheduler::Duration(0));
}

void PollScheduler::scheduleNext(TimerScheduler::Duration delay)
{
    timer_.registerTimer(delay, [this] {
        runCycle();
        if (running_) scheduleNext(cadence_);
    });
}

void PollScheduler::runForever()
{
    start();
    std::unique_lock<std::mutex> lk(m_);
    stopped_.wait(lk, [this] { return !running_.load(); });
    spdlog::info("PollScheduler: stopped after {} cycles", cycles_.load());
}

void PollScheduler::shutdown()
{
    {
        std::lock_guard<std::mutex> lk(m_);
        stopRequested_ = true;
        running_ = false;
    }
    stopped_.notify_all();
    timer_.shutdown();
}
