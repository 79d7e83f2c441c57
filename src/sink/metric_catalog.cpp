#include "sink/metric_catalog.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <stdexcept>

MetricCatalog::MetricCatalog(std::shared_ptr<prometheus::Registry> registry)
    : registry_(std::move(registry))
{
    if (!registry_) throw std::invalid_argument("MetricCatalog: registry is null");
}

std::vector<CatalogEntry> MetricCatalog::loadEntries(const Config& config)
{
    auto entries = config.getArray<CatalogEntry>("metric_catalog", "metrics",
        [](const YAML::Node& node) {
            CatalogEntry e;
            e.suffix = node["name"].as<std::string>();
            e.help   = node["help"] ? node["help"].as<std::string>() : e.suffix;
            return e;
        });
    spdlog::info("MetricCatalog: {} catalog entries", entries.size());
    return entries;
}

std::vector<std::string> MetricCatalog::registerSites(const Inventory& inventory,
                                                      const SchemaSet& schemas,
                                                      const std::vector<CatalogEntry>& entries)
{
    std::map<std::string, std::string> help;
    for (const auto& e : entries) help[e.suffix] = e.help;

    std::vector<std::string> missing;
    for (const auto& site : inventory.sites()) {
        std::set<DeviceKind> kinds;
        for (const auto& dev : site.devices) kinds.insert(dev.kind);

        for (auto kind : kinds) {
            const auto* schema = schemas.find(kind);
            if (!schema) continue;
            for (const auto& suffix : schema->publishedFields()) {
                auto name = canonicalName(site.id, suffix);
                auto it = help.find(suffix);
                if (it == help.end()) {
                    missing.push_back(name);
                    continue;
                }
                add(name, it->second);
            }
        }
    }
    spdlog::info("MetricCatalog: registered {} gauges for {} sites", gauges_.size(), inventory.sites().size());
    return missing;
}

prometheus::Gauge& MetricCatalog::add(const std::string& name, const std::string& help)
{
    auto it = gauges_.find(name);
    if (it != gauges_.end()) return *it->second;

    try {
        auto& gauge = prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Register(*registry_)
            .Add({});
        gauges_.emplace(name, &gauge);
        spdlog::debug("MetricCatalog: registered gauge {}", name);
        return gauge;
    } catch (const std::invalid_argument& e) {
        spdlog::error("MetricCatalog: cannot register '{}': {}", name, e.what());
        throw std::runtime_error(fmt::format("MetricCatalog: invalid metric name '{}'", name));
    }
}

prometheus::Gauge* MetricCatalog::find(const std::string& name) const
{
    auto it = gauges_.find(name);
    return it == gauges_.end() ? nullptr : it->second;
}

std::vector<std::string> MetricCatalog::names() const
{
    std::vector<std::string> out;
    out.reserve(gauges_.size());
    for (const auto& [name, _] : gauges_) out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
}
