#include "mcp/HealthMonitor.h"

HealthMonitor::HealthMonitor(Check check, std::chrono::milliseconds interval, IEventSink& events)
    : check(std::move(check)), interval(interval), events(events) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (running) return;
    running = true;
    stopRequested = false;
    worker = std::thread(&HealthMonitor::loop, this);
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running) return;
        stopRequested = true;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();

    std::lock_guard<std::mutex> lock(mtx);
    running = false;
}

bool HealthMonitor::isRunning() const {
    std::lock_guard<std::mutex> lock(mtx);
    return running && !stopRequested;
}

int HealthMonitor::getCycleCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return cycles;
}

void HealthMonitor::loop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stopRequested) {
        if (cv.wait_for(lock, interval, [this] { return stopRequested; })) {
            break;
        }
        lock.unlock();
        try {
            check();
        } catch (const std::exception& e) {
            events.warning(std::string("Health check cycle failed: ") + e.what());
        }
        lock.lock();
        ++cycles;
    }
}
