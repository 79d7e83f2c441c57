#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

// 一次页面探测的结果
struct PageProbe {
    bool                     loaded{false};   // document.readyState == "complete"
    std::vector<std::string> blocks;          // 命中选择器的各元素文本
};

// 一个已打开的渲染会话，对象析构即释放会话（浏览器进程）
// 出错时抛出 CollectError
class BrowserSession {
public:
    virtual ~BrowserSession() = default;

    virtual void navigate(const std::string& url, std::chrono::milliseconds timeout) = 0;
    virtual PageProbe probe(const std::string& selector, std::chrono::milliseconds timeout) = 0;
};

class BrowserDriver {
public:
    virtual ~BrowserDriver() = default;

    // 打开新会话，失败抛出 CollectError
    virtual std::unique_ptr<BrowserSession> open(std::chrono::milliseconds timeout) = 0;
};
