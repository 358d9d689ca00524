#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

class TimerScheduler {
public:
    using Task      = std::function<void()>;
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::milliseconds;

    struct TimerTask {
        TimePoint nextRun;
        Duration  interval;
        size_t    id;
        bool      repeat;

        bool operator<(const TimerTask& other) const {
            return nextRun > other.nextRun;
        }
    };

    explicit TimerScheduler(size_t numWorkers = 1);
    ~TimerScheduler();

    TimerScheduler(const TimerScheduler&)            = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    // 幂等，可重复调用
    void shutdown();

    // 注册单次定时任务
    size_t registerTimer(Duration delay, Task task);

    // 注册重复定时任务，首次执行在 firstDelay 之后
    size_t registerRepeatingTimer(Duration interval, Task task);
    size_t registerRepeatingTimer(Duration interval, Duration firstDelay, Task task);

    // 取消任务；正在执行的那一次不会被打断
    bool cancelTimer(size_t id);

    size_t pending() const;

private:
    size_t addTask(Task task, Duration interval, Duration firstDelay, bool repeat);

    void schedulerLoop();
    void workerLoop();

    std::vector<std::thread> workers;
    std::thread              schedulerThread;

    // 堆里只放调度信息，任务体放在 taskMap 里，取消即从 map 删除
    std::priority_queue<TimerTask>  tasks;
    std::unordered_map<size_t, Task> taskMap;

    std::queue<Task> taskQueue;

    mutable std::mutex      mtx;
    std::mutex              queueMtx;
    std::condition_variable cv;
    std::condition_variable workerCv;

    std::atomic<bool>   stop;
    std::atomic<size_t> nextId;
};
