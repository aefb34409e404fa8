#pragma once

#include "periodic_worker.hpp"
#include <chrono>
#include <cstddef>

namespace concord
{

    class DecisionRegistry;

    /**
     * Background worker that resolves overdue decisions as timeouts.
     * Shares the registry's resolution path, so a decision that resolves
     * through a vote at the same moment is never resolved twice.
     */
    class TimeoutSweeper
    {
    public:
        TimeoutSweeper(DecisionRegistry &registry, std::chrono::milliseconds interval);

        void start();
        void stop();

        /** Run one sweep on the calling thread */
        std::size_t sweep_once();

        bool running() const { return worker_.running(); }

    private:
        DecisionRegistry &registry_;
        PeriodicWorker worker_;
    };

} // namespace concord
