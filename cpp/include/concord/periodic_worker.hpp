#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace concord
{

    /**
     * Runs a task on a dedicated thread every interval until stopped.
     * stop() wakes the thread immediately and joins it. A task that throws
     * is logged and the schedule continues.
     */
    class PeriodicWorker
    {
    public:
        PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
        ~PeriodicWorker();

        PeriodicWorker(const PeriodicWorker &) = delete;
        PeriodicWorker &operator=(const PeriodicWorker &) = delete;

        void start();
        void stop();

        bool running() const { return running_; }

        /** Number of completed task runs */
        std::size_t ticks() const { return ticks_; }

    private:
        void loop();

        std::string name_;
        std::chrono::milliseconds interval_;
        std::function<void()> task_;

        std::mutex mutex_;
        std::condition_variable cv_;
        bool stop_requested_{false};
        std::atomic<bool> running_{false};
        std::atomic<std::size_t> ticks_{0};
        std::thread thread_;
    };

} // namespace concord
