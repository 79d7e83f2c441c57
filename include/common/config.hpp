#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

class Config {
public:
    // 从文件加载
    explicit Config(const std::string& filePath);

    // 从字符串加载（测试与内嵌配置使用）
    static Config fromString(const std::string& yamlText);

    // 基本类型读取
    int         getInt   (const std::string& parentKey,
                          const std::string& key) const;
    std::string getString(const std::string& parentKey,
                          const std::string& key) const;

    // 带默认值读取：键不存在时返回 fallback，类型错误仍然抛出
    int         getIntOr   (const std::string& parentKey,
                            const std::string& key, int fallback) const;
    std::string getStringOr(const std::string& parentKey,
                            const std::string& key,
                            const std::string& fallback) const;

    bool        has(const std::string& parentKey) const;
    bool        has(const std::string& parentKey, const std::string& key) const;

    // 原始节点，交给各模块自行解析
    YAML::Node  getNode(const std::string& parentKey) const;

    // 数组读取
    template<typename T>
    std::vector<T> getArray(const std::string& parentKey,
                            const std::string& key) const
    {
        try {
            return root_[parentKey][key].as<std::vector<T>>();
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Config: missing or bad type for [" +
                                    parentKey + "][" + key + "]");
        }
    }

    template <typename T>
    std::vector<T> getArray(const std::string& parentKey,
                            const std::string& key,
                            std::function<T(const YAML::Node&)> decoder) const
    {
        try {
            std::vector<T> out;
            const auto& list = root_[parentKey][key];
            if (!list.IsSequence())
                throw YAML::Exception(YAML::Mark::null_mark(),
                                    "not a sequence");

            out.reserve(list.size());
            for (const auto& node : list)
                out.push_back(decoder(node));
            return out;
        } catch (const YAML::Exception& e) {
            spdlog::error("Config: error decoding array [{}][{}]: {}", parentKey, key, e.what());
            throw std::runtime_error("Config: missing or bad array [" +
                                    parentKey + "][" + key + "]");
        }
    }

    static Config& instance(std::string path = "") {
        static Config c = Config(initOnce(path));
        return c;
    }

private:
    explicit Config(YAML::Node root);

    static const std::string& initOnce(const std::string& path) {
        static std::string stored;
        if (!stored.empty()) return stored;          // 已初始化过
        if (path.empty())
            throw std::runtime_error("Config path not provided on first call");
        stored = path;
        return stored;
    }
    YAML::Node root_;
};
