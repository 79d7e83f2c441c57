#include "common/signal_waiter.hpp"

#include <cstring>
#include <stdexcept>
#include <pthread.h>
#include <spdlog/spdlog.h>

namespace {

sigset_t makeSet(const std::vector<int>& signals)
{
    sigset_t set;
    sigemptyset(&set);
    for (int sig : signals) sigaddset(&set, sig);
    return set;
}

} // namespace

void SignalWaiter::block(const std::vector<int>& signals)
{
    auto set = makeSet(signals);
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw std::runtime_error(std::string("SignalWaiter: pthread_sigmask failed: ") + std::strerror(rc));
    }
}

SignalWaiter::SignalWaiter(std::vector<int> signals, Handler onSignal)
    : signals_(std::move(signals)), set_(makeSet(signals_)), handler_(std::move(onSignal))
{
    if (signals_.empty()) throw std::invalid_argument("SignalWaiter: no signals to wait for");
    thread_ = std::thread([this] { wait(); });
}

SignalWaiter::~SignalWaiter()
{
    stopping_ = true;
    // 等待线程仍阻塞在 sigwait 时，投递一个定向信号把它叫醒
    if (!fired_) pthread_kill(thread_.native_handle(), signals_.front());
    if (thread_.joinable()) thread_.join();
}

void SignalWaiter::wait()
{
    int sig = 0;
    int rc = sigwait(&set_, &sig);
    if (rc != 0) {
        spdlog::error("SignalWaiter: sigwait failed: {}", std::strerror(rc));
        return;
    }
    if (stopping_) return;

    fired_ = true;
    spdlog::info("SignalWaiter: received signal {}", sig);
    try {
        handler_(sig);
    } catch (const std::exception& e) {
        spdlog::error("SignalWaiter: handler for signal {} threw: {}", sig, e.what());
    }
}
