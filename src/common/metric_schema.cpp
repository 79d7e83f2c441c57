#include "common/metric_schema.hpp"
#include "collector/snmp_codec.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <stdexcept>

std::string canonicalName(const std::string& site, const std::string& suffix)
{
    return site + "_" + suffix;
}

std::set<std::string> DeviceSchema::exclusionSet(const std::string& site) const
{
    std::set<std::string> out;
    for (const auto& name : exclude) out.insert(canonicalName(site, name));
    return out;
}

std::vector<std::string> DeviceSchema::publishedFields() const
{
    std::set<std::string> skip(exclude.begin(), exclude.end());
    std::vector<std::string> out;
    for (const auto& f : fields) {
        if (!skip.count(f)) out.push_back(f);
    }
    return out;
}

namespace {

std::vector<std::string> readStringList(const YAML::Node& node, const char* key)
{
    std::vector<std::string> out;
    const auto list = node[key];
    if (!list) return out;
    if (!list.IsSequence()) {
        throw std::runtime_error(fmt::format("Config: [schemas] '{}' must be a sequence", key));
    }
    for (const auto& item : list) out.push_back(item.as<std::string>());
    return out;
}

} // namespace

SchemaSet SchemaSet::load(const Config& config)
{
    SchemaSet set;
    const auto root = config.getNode("schemas");
    try {
        if (const auto scrape = root[DEVICE_KIND_SCRAPE]) {
            DeviceSchema s;
            s.kind    = DeviceKind::Scrape;
            s.fields  = readStringList(scrape, "fields");
            s.exclude = readStringList(scrape, "exclude");
            set.add(std::move(s));
        }
        if (const auto query = root[DEVICE_KIND_QUERY]) {
            DeviceSchema s;
            s.kind = DeviceKind::Query;
            const auto objects = query["objects"];
            if (!objects || !objects.IsSequence()) {
                throw std::runtime_error("Config: [schemas][query] needs an 'objects' sequence");
            }
            for (const auto& obj : objects) {
                QueryObject o;
                o.name = obj["name"].as<std::string>();
                o.oid  = obj["oid"].as<std::string>();
                s.fields.push_back(o.name);
                s.objects.push_back(std::move(o));
            }
            s.exclude = readStringList(query, "exclude");
            set.add(std::move(s));
        }
    } catch (const YAML::Exception& e) {
        spdlog::error("SchemaSet: error decoding [schemas]: {}", e.what());
        throw std::runtime_error("Config: missing or bad type in [schemas]");
    }

    if (set.empty()) {
        spdlog::warn("SchemaSet: no schema configured, nothing will be published");
    }
    return set;
}

void SchemaSet::add(DeviceSchema schema)
{
    check(schema);
    // 同一站点的不同类型设备共用 {site}_ 前缀，后缀不能重叠
    for (const auto& [kind, other] : schemas_) {
        if (kind == schema.kind) continue;
        for (const auto& f : schema.fields) {
            if (std::find(other.fields.begin(), other.fields.end(), f) != other.fields.end()) {
                throw std::runtime_error(fmt::format("SchemaSet: field '{}' appears in both {} and {} schemas",
                                                     f, toString(kind), toString(schema.kind)));
            }
        }
    }
    spdlog::debug("SchemaSet: {} schema with {} fields ({} excluded)",
                  toString(schema.kind), schema.fields.size(), schema.exclude.size());
    auto kind = schema.kind;
    schemas_[kind] = std::move(schema);
}

const DeviceSchema* SchemaSet::find(DeviceKind kind) const
{
    auto it = schemas_.find(kind);
    if (it == schemas_.end()) return nullptr;
    return &it->second;
}

void SchemaSet::check(const DeviceSchema& schema)
{
    if (schema.kind == DeviceKind::Unknown) {
        throw std::runtime_error("SchemaSet: schema without a device kind");
    }
    std::set<std::string> names;
    for (const auto& f : schema.fields) {
        if (f.empty()) {
            throw std::runtime_error(fmt::format("SchemaSet: empty field name in {} schema",
                                                 toString(schema.kind)));
        }
        if (!names.insert(f).second) {
            throw std::runtime_error(fmt::format("SchemaSet: duplicate field '{}' in {} schema",
                                                 f, toString(schema.kind)));
        }
    }
    for (const auto& obj : schema.objects) {
        try {
            snmp::parseOid(obj.oid);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(fmt::format("SchemaSet: object '{}' has bad oid '{}': {}",
                                                 obj.name, obj.oid, e.what()));
        }
    }
    for (const auto& ex : schema.exclude) {
        if (!names.count(ex)) {
            spdlog::warn("SchemaSet: excluded field '{}' is not part of the {} schema",
                         ex, toString(schema.kind));
        }
    }
}

std::vector<std::string> SchemaSet::validateAgainst(const std::set<std::string>& catalogSuffixes) const
{
    std::vector<std::string> problems;
    std::set<std::string> used;
    for (const auto& [kind, schema] : schemas_) {
        for (const auto& f : schema.publishedFields()) {
            used.insert(f);
            if (!catalogSuffixes.count(f)) {
                problems.push_back(fmt::format("{} field '{}' is not in the metric catalog",
                                               toString(kind), f));
            }
        }
    }
    for (const auto& name : catalogSuffixes) {
        if (!used.count(name)) {
            spdlog::warn("SchemaSet: catalog metric '{}' is not produced by any schema", name);
        }
    }
    return problems;
}
