#include "collector/collector_type.h"

const char* toString(DeviceKind kind)
{
    switch (kind) {
        case DeviceKind::Scrape:  return DEVICE_KIND_SCRAPE;
        case DeviceKind::Query:   return DEVICE_KIND_QUERY;
        case DeviceKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char* toString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::ConnectivityTimeout: return "ConnectivityTimeout";
        case ErrorKind::ProtocolError:       return "ProtocolError";
        case ErrorKind::StructureError:      return "StructureError";
        case ErrorKind::ParseError:          return "ParseError";
        case ErrorKind::ConfigurationError:  return "ConfigurationError";
    }
    return "UnknownError";
}

DeviceKind parseDeviceKind(const std::string& name)
{
    if (name == DEVICE_KIND_SCRAPE) return DeviceKind::Scrape;
    if (name == DEVICE_KIND_QUERY)  return DeviceKind::Query;
    return DeviceKind::Unknown;
}
