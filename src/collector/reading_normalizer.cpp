#include "collector/reading_normalizer.hpp"
#include "common/metric_schema.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace normalizer {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// 从 pos 开始匹配 [-+]?\d*\.?\d+，返回匹配长度，0 表示不匹配
std::size_t matchAt(const std::string& text, std::size_t pos)
{
    const std::size_t n = text.size();
    std::size_t i = pos;
    if (text[i] == '-' || text[i] == '+') ++i;

    std::size_t digits = i;
    while (digits < n && isDigit(text[digits])) ++digits;

    if (digits < n && text[digits] == '.' && digits + 1 < n && isDigit(text[digits + 1])) {
        std::size_t frac = digits + 1;
        while (frac < n && isDigit(text[frac])) ++frac;
        return frac - pos;
    }
    return digits > i ? digits - pos : 0;
}

} // namespace

std::optional<double> extractNumber(const std::string& text)
{
    // 线性扫描，输入长度不受限
    std::string token;
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        if (auto len = matchAt(text, pos)) {
            token = text.substr(pos, len);
            break;
        }
    }
    if (token.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || errno == ERANGE || !std::isfinite(v)) return std::nullopt;
    return v;
}

std::map<std::string, double> normalize(const std::string& site,
                                        const std::vector<RawField>& fields,
                                        const std::vector<std::string>& schema,
                                        const std::set<std::string>& exclusions)
{
    std::map<std::string, double> out;
    std::size_t unmapped = 0;

    for (const auto& field : fields) {
        std::string suffix;
        if (!field.name.empty()) {
            suffix = field.name;
        } else if (field.index < schema.size()) {
            suffix = schema[field.index];
        } else {
            ++unmapped;     // 值比 schema 长，多余的值丢弃
            continue;
        }

        auto value = extractNumber(field.value);
        if (!value) {
            spdlog::debug("normalizer: {} field '{}' has no number in '{}', skipped",
                          site, suffix, field.value);
            continue;
        }
        out[canonicalName(site, suffix)] = *value;
    }

    if (unmapped) {
        spdlog::debug("normalizer: {} dropped {} values beyond the {}-field schema",
                      site, unmapped, schema.size());
    }

    for (const auto& name : exclusions) out.erase(name);
    return out;
}

} // namespace normalizer
