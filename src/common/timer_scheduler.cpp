#include "common/timer_scheduler.hpp"
#include <spdlog/spdlog.h>

TimerScheduler::TimerScheduler(size_t numWorkers)
    : stop(false), nextId(0) {
    if (numWorkers == 0) numWorkers = 1;
    for (size_t i = 0; i < numWorkers; ++i) {
        workers.emplace_back([this] { workerLoop(); });
    }
    schedulerThread = std::thread([this] { schedulerLoop(); });
}

TimerScheduler::~TimerScheduler() {
    shutdown();
}

void TimerScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stop = true;
        live.clear();
    }
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        std::queue<Task>().swap(taskQueue);
    }
    cv.notify_all();
    workerCv.notify_all();

    const auto self = std::this_thread::get_id();
    for (auto& worker : workers) {
        if (!worker.joinable()) continue;
        if (worker.get_id() == self) {
            // 在任务内部调用 shutdown，不能 join 自己，留给析构
            spdlog::warn("TimerScheduler: shutdown called from a worker thread");
            continue;
        }
        worker.join();
    }
    if (schedulerThread.joinable() && schedulerThread.get_id() != self) {
        schedulerThread.join();
    }
}

size_t TimerScheduler::registerTimer(Duration delay, Task task) {
    std::lock_guard<std::mutex> lock(mtx);
    auto id = nextId++;
    if (stop) return id;              // 已停止，静默丢弃
    tasks.push(TimerTask{Clock::now() + delay, std::move(task), id});
    live.insert(id);
    cv.notify_one();
    return id;
}

bool TimerScheduler::cancelTimer(size_t id) {
    std::lock_guard<std::mutex> lock(mtx);
    return live.erase(id) > 0;
}

size_t TimerScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mtx);
    return live.size();
}

void TimerScheduler::schedulerLoop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stop) {
        if (tasks.empty()) {
            cv.wait(lock, [this] { return stop || !tasks.empty(); });
            continue;
        }

        auto nextRun = tasks.top().nextRun;
        if (nextRun > Clock::now()) {
            cv.wait_until(lock, nextRun);
            continue;
        }

        auto task = tasks.top();
        tasks.pop();
        if (live.erase(task.id) == 0) continue;   // 已取消

        {
            std::lock_guard<std::mutex> ql(queueMtx);
            taskQueue.push(std::move(task.task));
        }
        workerCv.notify_one();
    }
}

void TimerScheduler::workerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMtx);
            workerCv.wait(lock, [this] { return stop || !taskQueue.empty(); });
            if (stop) break;
            task = std::move(taskQueue.front());
            taskQueue.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("TimerScheduler: Task execution failed: {}", e.what());
        }
    }
}
