#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <set>
#include <fstream>
#include <iostream>
#include <map>
#include <signal.h>
#include <unistd.h>

#include <cxxopts.hpp>
#include <curl/curl.h>
#include <fmt/core.h>
#include <prometheus/exposer.h>
#include <prometheus/registry.h>
#include <spdlog/spdlog.h>

#include "common/config.hpp"
#include "common/inventory.hpp"
#include "common/metric_schema.hpp"
#include "common/signal_waiter.hpp"

#include "collector/collector_registry.hpp"
#include "collector/poll_scheduler.hpp"
#include "sink/metric_catalog.hpp"
#include "sink/prometheus_sink.hpp"

void init() {
    // 初始化日志系统
    const static auto log_level_map = std::map<std::string, spdlog::level::level_enum>{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    auto log_level = Config::instance().getStringOr("lens_config", "log_level", "info");
    auto it = log_level_map.find(log_level);
    if (it == log_level_map.end()) {
        log_level = "info"; // 默认 info 级别
    }
    auto level_enum = log_level_map.at(log_level);
    spdlog::set_level(level_enum); // 设置日志级别
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v"); // 设置日志格式
}

bool already_running()
{
    auto PIDFILE = Config::instance().getStringOr("lens_config", "lock_path", "");
    if (PIDFILE.empty()) return false;
    std::ifstream ifs(PIDFILE);
    if (ifs) {
        pid_t oldpid;
        ifs >> oldpid;
        if (oldpid > 0 && oldpid != getpid() && kill(oldpid, 0) == 0)   // 0 信号仅检测
            return true;                          // 同名进程存活
    }

    /* 把当前 pid 写进去 */
    std::ofstream ofs(PIDFILE);
    if (!ofs) {
        spdlog::warn("Main: cannot create pid file {}", PIDFILE);
        return false;                             // 保守起见，允许启动
    }
    ofs << getpid() << std::endl;
    return false;                                 // 可以继续跑
}

// 只为清单里实际出现、且配置了 schema 的设备类型创建采集器
CollectorMap build_collectors(const Config& config, const Inventory& inventory, const SchemaSet& schemas)
{
    CollectorMap collectors;
    for (const auto& site : inventory.sites()) {
        for (const auto& dev : site.devices) {
            if (dev.kind == DeviceKind::Unknown || collectors.count(dev.kind)) continue;

            const auto* schema = schemas.find(dev.kind);
            if (!schema) {
                spdlog::error("Main: no schema for device kind '{}', its devices will be skipped", dev.kindName);
                continue;
            }
            auto collector = CollectorRegistry::instance().createCollector(dev.kind);
            if (!collector) {
                spdlog::error("Main: no collector registered for kind '{}'", dev.kindName);
                continue;
            }
            if (!collector->init(config, *schema)) {
                spdlog::error("Main: {} collector init failed, its devices will be skipped", dev.kindName);
                continue;
            }
            collectors.emplace(dev.kind, std::move(collector));
        }
    }
    return collectors;
}

int run(const cxxopts::ParseResult& result) {
    auto& config = Config::instance();

    auto inventory = Inventory::load(config);
    auto schemas   = SchemaSet::load(config);
    auto entries   = MetricCatalog::loadEntries(config);

    std::set<std::string> suffixes;
    for (const auto& e : entries) suffixes.insert(e.suffix);
    for (const auto& problem : schemas.validateAgainst(suffixes)) {
        spdlog::error("Main: ConfigurationError: {}", problem);
    }

    auto registry = std::make_shared<prometheus::Registry>();
    MetricCatalog catalog(registry);
    auto missing = catalog.registerSites(inventory, schemas, entries);
    if (!missing.empty()) {
        spdlog::warn("Main: {} schema metrics are not in the catalog and will be rejected", missing.size());
    }
    PrometheusSink sink(catalog);

    auto cadence_seconds = config.getIntOr("lens_config", "cadence_seconds", 30);
    if (cadence_seconds < 1) {
        throw std::runtime_error(fmt::format("Config: [lens_config][cadence_seconds] must be at least 1, got {}",
                                             cadence_seconds));
    }

    auto collectors = build_collectors(config, inventory, schemas);
    PollScheduler scheduler(std::move(inventory), std::move(schemas), std::move(collectors), sink,
                            std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::seconds(cadence_seconds)));

    // SIGINT/SIGTERM 交给专门的线程同步等待，两种模式都能中断
    SignalWaiter signals({SIGINT, SIGTERM}, [&scheduler](int) { scheduler.shutdown(); });

    if (result.count("once")) {
        auto report = scheduler.runCycle();
        if (signals.fired()) {
            spdlog::warn("Main: single cycle interrupted after {} devices", report.outcomes.size());
            return 2;
        }
        return report.failed() == 0 ? 0 : 2;
    }

    auto bind = config.getStringOr("exporter_config", "bind_address", "0.0.0.0:8000");
    prometheus::Exposer exposer{bind};
    exposer.RegisterCollectable(registry);
    spdlog::info("Main: serving metrics on http://{}/metrics", bind);

    scheduler.runForever();   // 正常情况下不返回，直到收到信号
    return 0;
}

int start(const cxxopts::ParseResult& result) {
    // 在创建任何线程之前屏蔽信号，子线程继承该掩码
    SignalWaiter::block({SIGINT, SIGTERM});

    Config::instance(result["config"].as<std::string>());
    init();

    if (already_running()) {
        spdlog::critical("Main: Another SiteLens has already started");
        return 0;
    }

    // libcurl 全局状态在进程内只初始化一次
    struct CurlGlobal {
        CurlGlobal()  { curl_global_init(CURL_GLOBAL_ALL); }
        ~CurlGlobal() { curl_global_cleanup(); }
    } curl_global;

    return run(result);
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("SiteLens", "A multi-protocol site telemetry poller");
    options.add_options()
        ("h,help", "Show help")
        ("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value("config.yaml"))
        ("once", "Run a single polling cycle and exit");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        return start(result);
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        return 1;
    }
}
