#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include <prometheus/metric_family.h>

#include "collector/collector_registry.hpp"
#include "sink/metric_catalog.hpp"
#include "sink/prometheus_sink.hpp"

namespace {

double exported(const prometheus::Registry& registry, const std::string& name)
{
    for (const auto& family : registry.Collect()) {
        if (family.name == name && !family.metric.empty()) return family.metric.front().gauge.value;
    }
    ADD_FAILURE() << name << " not exported";
    return -1.0;
}

bool isExported(const prometheus::Registry& registry, const std::string& name)
{
    for (const auto& family : registry.Collect()) {
        if (family.name == name) return true;
    }
    return false;
}

Inventory pineAndOak()
{
    return Inventory({
        Site{"Pine", {Device{"Solar", DeviceKind::Scrape, "scrape", "10.0.0.5"}}},
        Site{"Oak",  {Device{"Radio", DeviceKind::Query,  "query",  "10.0.1.6"}}},
    });
}

SchemaSet twoSchemas()
{
    SchemaSet schemas;
    DeviceSchema scrape;
    scrape.kind = DeviceKind::Scrape;
    scrape.fields = {"array_current", "array_voltage", "charge_state"};
    scrape.exclude = {"charge_state"};
    schemas.add(scrape);

    DeviceSchema query;
    query.kind = DeviceKind::Query;
    query.objects = {{"rx_level", "1.3.6.1.4.1.41112.1.4.5.1.5.1"}, {"tx_power", "1.3.6.1.4.1.41112.1.4.1.1.6.1"}};
    query.fields = {"rx_level", "tx_power"};
    schemas.add(query);
    return schemas;
}

std::vector<CatalogEntry> entries()
{
    return {
        {"array_current", "Solar array current"},
        {"array_voltage", "Solar array voltage"},
        {"rx_level", "Radio receive level"},
    };
}

} // namespace

TEST(MetricCatalog, RegistersOnlyKindsPresentAtEachSite)
{
    auto registry = std::make_shared<prometheus::Registry>();
    MetricCatalog catalog(registry);
    auto missing = catalog.registerSites(pineAndOak(), twoSchemas(), entries());

    EXPECT_EQ(catalog.names(), (std::vector<std::string>{"Oak_rx_level", "Pine_array_current", "Pine_array_voltage"}));
    EXPECT_EQ(missing, (std::vector<std::string>{"Oak_tx_power"}));
    EXPECT_EQ(catalog.find("Pine_charge_state"), nullptr);
    EXPECT_EQ(catalog.find("Oak_array_current"), nullptr);
}

TEST(MetricCatalog, AddIsIdempotentAndRejectsBadNames)
{
    MetricCatalog catalog(std::make_shared<prometheus::Registry>());
    auto& first = catalog.add("Pine_array_current", "a");
    auto& again = catalog.add("Pine_array_current", "a");
    EXPECT_EQ(&first, &again);
    EXPECT_EQ(catalog.size(), 1u);

    EXPECT_THROW(catalog.add("Pine array", "bad"), std::runtime_error);
    EXPECT_THROW(MetricCatalog(nullptr), std::invalid_argument);
}

TEST(PrometheusSink, PublishOverwritesLastValue)
{
    auto registry = std::make_shared<prometheus::Registry>();
    MetricCatalog catalog(registry);
    catalog.registerSites(pineAndOak(), twoSchemas(), entries());
    PrometheusSink sink(catalog);

    EXPECT_TRUE(sink.publish("Pine_array_current", 84.0));
    EXPECT_DOUBLE_EQ(exported(*registry, "Pine_array_current"), 84.0);

    EXPECT_TRUE(sink.publish("Pine_array_current", 79.5));
    EXPECT_TRUE(sink.publish("Pine_array_current", 79.5));
    EXPECT_DOUBLE_EQ(exported(*registry, "Pine_array_current"), 79.5);
    EXPECT_EQ(sink.published(), 3u);
}

TEST(PrometheusSink, UnknownNameIsRejectedNotCreated)
{
    auto registry = std::make_shared<prometheus::Registry>();
    MetricCatalog catalog(registry);
    catalog.registerSites(pineAndOak(), twoSchemas(), entries());
    PrometheusSink sink(catalog);

    EXPECT_FALSE(sink.publish("Pine_unknown_metric", 1.0));
    EXPECT_FALSE(sink.publish("Oak_tx_power", 17.0));
    EXPECT_EQ(sink.rejected(), 2u);
    EXPECT_FALSE(isExported(*registry, "Pine_unknown_metric"));
    EXPECT_FALSE(isExported(*registry, "Oak_tx_power"));
}

TEST(PrometheusSink, ConcurrentPublishersLeaveOneOfTheirValues)
{
    auto registry = std::make_shared<prometheus::Registry>();
    MetricCatalog catalog(registry);
    catalog.registerSites(pineAndOak(), twoSchemas(), entries());
    PrometheusSink sink(catalog);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&sink, t] {
            for (int i = 0; i < 1000; ++i) sink.publish("Oak_rx_level", static_cast<double>(t));
        });
    }
    // 抓取与写入并发进行
    for (int i = 0; i < 50; ++i) registry->Collect();
    for (auto& w : writers) w.join();

    auto v = exported(*registry, "Oak_rx_level");
    EXPECT_GE(v, 0.0);
    EXPECT_LE(v, 3.0);
    EXPECT_EQ(v, static_cast<double>(static_cast<int>(v)));
    EXPECT_EQ(sink.published(), 4000u);
}

TEST(CollectorRegistry, BothKindsAreRegistered)
{
    auto kinds = CollectorRegistry::instance().list();
    EXPECT_EQ(kinds.size(), 2u);
    auto scrape = CollectorRegistry::instance().createCollector(DeviceKind::Scrape);
    ASSERT_NE(scrape, nullptr);
    EXPECT_EQ(scrape->kind(), DeviceKind::Scrape);
    auto query = CollectorRegistry::instance().createCollector(DeviceKind::Query);
    ASSERT_NE(query, nullptr);
    EXPECT_EQ(query->kind(), DeviceKind::Query);
    EXPECT_EQ(CollectorRegistry::instance().createCollector(DeviceKind::Unknown), nullptr);
}
