#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>
#include <vector>

// 单次定时任务；到期的任务交给工作线程执行
// 只有一个工作线程时，任务严格串行，不会重叠
class TimerScheduler {
public:
    using Task      = std::function<void()>;
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::milliseconds;

    struct TimerTask {
        TimePoint nextRun;
        Task      task;
        size_t    id;

        bool operator<(const TimerTask& other) const {
            return nextRun > other.nextRun;
        }
    };

    explicit TimerScheduler(size_t numWorkers = 1);
    ~TimerScheduler();

    // 停止调度，丢弃未到期任务，等待正在执行的任务结束
    void shutdown();

    // 注册单次定时任务
    size_t registerTimer(Duration delay, Task task);

    // 取消任务（尚未开始执行时有效）
    bool cancelTimer(size_t id);

    size_t pending() const;
    bool stopped() const { return stop; }

private:
    void schedulerLoop();
    void workerLoop();

    std::vector<std::thread> workers;
    std::thread              schedulerThread;

    std::priority_queue<TimerTask> tasks;
    std::unordered_set<size_t>     live;      // 未取消、未执行的任务 id

    std::queue<Task> taskQueue;

    mutable std::mutex      mtx;
    std::mutex              queueMtx;
    std::condition_variable cv;
    std::condition_variable workerCv;

    std::atomic<bool>   stop;
    std::atomic<size_t> nextId;
};
