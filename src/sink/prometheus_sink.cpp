#include "sink/prometheus_sink.hpp"

#include <spdlog/spdlog.h>

PrometheusSink::PrometheusSink(const MetricCatalog& catalog)
    : catalog_(catalog)
{
}

bool PrometheusSink::publish(const std::string& name, double value)
{
    auto* gauge = catalog_.find(name);
    if (!gauge) {
        ++rejected_;
        spdlog::error("PrometheusSink: ConfigurationError: metric '{}' is not in the catalog, skipped", name);
        return false;
    }
    gauge->Set(value);
    ++published_;
    spdlog::trace("PrometheusSink: {} = {}", name, value);
    return true;
}
