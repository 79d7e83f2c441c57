#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

#include <signal.h>

// 专用线程里 sigwait 等待信号，收到第一个信号后调用 handler 并退出
// 调用方须在创建任何线程之前用 block() 屏蔽这些信号
class SignalWaiter {
public:
    using Handler = std::function<void(int)>;

    SignalWaiter(std::vector<int> signals, Handler onSignal);
    ~SignalWaiter();    // 尚未收到信号时唤醒等待线程并回收

    SignalWaiter(const SignalWaiter&)            = delete;
    SignalWaiter& operator=(const SignalWaiter&) = delete;

    // 在当前线程屏蔽信号，之后创建的线程继承该掩码
    static void block(const std::vector<int>& signals);

    bool fired() const { return fired_; }

private:
    void wait();

    std::vector<int>  signals_;
    sigset_t          set_;
    Handler           handler_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> fired_{false};
    std::thread       thread_;
};
