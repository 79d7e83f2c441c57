#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "collector/collector_type.h"

namespace normalizer {

// 取文本中第一个数：可选符号、可选整数部分、可选小数部分
// "84 V" -> 84, "12.1 V" -> 12.1, "-.5dB" -> -0.5；没有数字返回 std::nullopt
std::optional<double> extractNumber(const std::string& text);

// 位置字段按 schema 命名，具名字段保留名字；统一加站点前缀，
// 无法解析的字段丢弃，最后去掉 exclusions 中的名字
std::map<std::string, double> normalize(const std::string& site,
                                        const std::vector<RawField>& fields,
                                        const std::vector<std::string>& schema,
                                        const std::set<std::string>& exclusions);

} // namespace normalizer
