#include "common/timer_scheduler.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

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
        std::lock_guard<std::mutex> qlock(queueMtx);
        stop = true;
    }
    cv.notify_all();
    workerCv.notify_all();
    if (schedulerThread.joinable() && schedulerThread.get_id() != std::this_thread::get_id()) {
        schedulerThread.join();
    }
    for (auto& worker : workers) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

size_t TimerScheduler::registerTimer(Duration delay, Task task) {
    return addTask(std::move(task), delay, delay, false);
}

size_t TimerScheduler::registerRepeatingTimer(Duration interval, Task task) {
    return addTask(std::move(task), interval, interval, true);
}

size_t TimerScheduler::registerRepeatingTimer(Duration interval, Duration firstDelay, Task task) {
    return addTask(std::move(task), interval, firstDelay, true);
}

bool TimerScheduler::cancelTimer(size_t id) {
    std::lock_guard<std::mutex> lock(mtx);
    return taskMap.erase(id) > 0;
}

size_t TimerScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mtx);
    return taskMap.size();
}

size_t TimerScheduler::addTask(Task task, Duration interval, Duration firstDelay, bool repeat) {
    std::lock_guard<std::mutex> lock(mtx);
    auto id = nextId++;
    if (stop) {
        spdlog::warn("TimerScheduler: task {} registered after shutdown, ignored", id);
        return id;
    }
    if (repeat && interval <= Duration::zero()) {
        throw std::invalid_argument("TimerScheduler: repeating interval must be positive");
    }

    taskMap.emplace(id, std::move(task));
    tasks.push(TimerTask{Clock::now() + firstDelay, interval, id, repeat});
    cv.notify_one();
    return id;
}

void TimerScheduler::schedulerLoop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stop) {
        if (tasks.empty()) {
            cv.wait(lock, [this] { return stop || !tasks.empty(); });
            continue;
        }

        auto now = Clock::now();
        if (tasks.top().nextRun > now) {
            cv.wait_until(lock, tasks.top().nextRun);
            continue;
        }

        auto timer = tasks.top();
        tasks.pop();

        auto it = taskMap.find(timer.id);
        if (it == taskMap.end()) continue;   // 已取消

        Task body = it->second;
        if (timer.repeat) {
            timer.nextRun += timer.interval;
            // 落后太多时不补跑，直接对齐到下一个周期
            if (timer.nextRun <= now) timer.nextRun = now + timer.interval;
            tasks.push(timer);
        } else {
            taskMap.erase(it);
        }

        {
            std::lock_guard<std::mutex> qlock(queueMtx);
            taskQueue.push(std::move(body));
        }
        workerCv.notify_one();
    }
}

void TimerScheduler::workerLoop() {
    while (true) {
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
