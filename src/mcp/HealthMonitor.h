#pragma once
#include <functional>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include "core/EventSink.h"

/**
 * @brief Runs a check on a fixed interval in a background thread.
 *
 * The first run happens one interval after start(). stop() wakes the
 * thread and joins it; a check already in progress is allowed to finish.
 */
class HealthMonitor {
public:
    using Check = std::function<void()>;

    HealthMonitor(Check check, std::chrono::milliseconds interval, IEventSink& events);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();
    void stop();
    bool isRunning() const;
    std::chrono::milliseconds getInterval() const { return interval; }
    int getCycleCount() const;

private:
    Check check;
    std::chrono::milliseconds interval;
    IEventSink& events;

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::thread worker;
    bool running = false;
    bool stopRequested = false;
    int cycles = 0;

    void loop();
};
