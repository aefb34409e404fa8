#include "concord/periodic_worker.hpp"
#include <spdlog/spdlog.h>

namespace concord
{

    PeriodicWorker::PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::function<void()> task)
        : name_(std::move(name)), interval_(interval), task_(std::move(task))
    {
    }

    PeriodicWorker::~PeriodicWorker()
    {
        stop();
    }

    void PeriodicWorker::start()
    {
        if (running_.exchange(true))
            return;
        {
            std::lock_guard lock(mutex_);
            stop_requested_ = false;
        }
        thread_ = std::thread([this] { loop(); });
        spdlog::debug("{} worker started (interval {} ms)", name_, interval_.count());
    }

    void PeriodicWorker::stop()
    {
        {
            std::lock_guard lock(mutex_);
            stop_requested_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable())
        {
            thread_.join();
            spdlog::debug("{} worker stopped", name_);
        }
        running_ = false;
    }

    void PeriodicWorker::loop()
    {
        std::unique_lock lock(mutex_);
        while (!stop_requested_)
        {
            if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; }))
                break;

            lock.unlock();
            try
            {
                task_();
            }
            catch (const std::exception &e)
            {
                spdlog::error("{} worker task failed: {}", name_, e.what());
            }
            ++ticks_;
            lock.lock();
        }
    }

} // namespace concord
