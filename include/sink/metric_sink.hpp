#pragma once

#include <string>

// 指标写入端：按名字覆盖写最新值，不保留历史；实现必须允许并发调用
class IMetricSink {
public:
    virtual ~IMetricSink() = default;

    // 名字未注册时返回 false（配置错误，由实现记录日志）
    virtual bool publish(const std::string& name, double value) = 0;
};
