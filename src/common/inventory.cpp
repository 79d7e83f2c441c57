#include "common/inventory.hpp"

#include <fmt/core.h>
#include <set>
#include <stdexcept>

Inventory::Inventory(std::vector<Site> sites)
    : sites_(std::move(sites))
{
    validate();
}

Inventory Inventory::load(const Config& config)
{
    auto sites = config.getArray<Site>("inventory", "sites",
        [](const YAML::Node& node) {
            Site s;
            s.id = node["id"].as<std::string>();
            const auto devices = node["devices"];
            if (devices && devices.IsSequence()) {
                for (const auto& d : devices) {
                    Device dev;
                    dev.name     = d["name"].as<std::string>();
                    dev.kindName = d["kind"].as<std::string>();
                    dev.kind     = parseDeviceKind(dev.kindName);
                    dev.address  = d["address"].as<std::string>();
                    s.devices.push_back(std::move(dev));
                }
            }
            return s;
        });

    Inventory inv(std::move(sites));
    for (const auto& site : inv.sites()) {
        if (site.devices.empty()) {
            spdlog::warn("Inventory: site '{}' has no devices", site.id);
        }
        for (const auto& dev : site.devices) {
            if (dev.kind == DeviceKind::Unknown) {
                // 不致命：调度时每轮都会报告并跳过
                spdlog::error("Inventory: device {}/{} declares unknown kind '{}'",
                              site.id, dev.name, dev.kindName);
            }
        }
    }
    spdlog::info("Inventory: loaded {} sites, {} devices", inv.sites().size(), inv.deviceCount());
    return inv;
}

std::size_t Inventory::deviceCount() const
{
    std::size_t n = 0;
    for (const auto& site : sites_) n += site.devices.size();
    return n;
}

bool Inventory::isValidSiteId(const std::string& id)
{
    if (id.empty()) return false;
    auto head = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':';
    };
    if (!head(id[0])) return false;
    for (char c : id) {
        if (!head(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

void Inventory::validate() const
{
    std::set<std::string> seen;
    for (const auto& site : sites_) {
        if (!isValidSiteId(site.id)) {
            throw std::runtime_error(fmt::format("Inventory: invalid site id '{}'", site.id));
        }
        if (!seen.insert(site.id).second) {
            throw std::runtime_error(fmt::format("Inventory: duplicate site id '{}'", site.id));
        }
        std::set<std::string> names;
        std::set<DeviceKind> kinds;
        for (const auto& dev : site.devices) {
            if (!names.insert(dev.name).second) {
                throw std::runtime_error(fmt::format("Inventory: duplicate device '{}' at site '{}'",
                                                     dev.name, site.id));
            }
            if (dev.address.empty()) {
                throw std::runtime_error(fmt::format("Inventory: device {}/{} has no address",
                                                     site.id, dev.name));
            }
            // 同一站点同类设备会产出同名指标
            if (dev.kind != DeviceKind::Unknown && !kinds.insert(dev.kind).second) {
                throw std::runtime_error(fmt::format("Inventory: site '{}' has more than one {} device",
                                                     site.id, toString(dev.kind)));
            }
        }
    }
}
