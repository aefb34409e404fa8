#include "concord/timeout_sweeper.hpp"
#include "concord/decision_registry.hpp"
#include <spdlog/spdlog.h>

namespace concord
{

    TimeoutSweeper::TimeoutSweeper(DecisionRegistry &registry, std::chrono::milliseconds interval)
        : registry_(registry),
          worker_("timeout-sweeper", interval, [this] { sweep_once(); })
    {
    }

    void TimeoutSweeper::start()
    {
        worker_.start();
    }

    void TimeoutSweeper::stop()
    {
        worker_.stop();
    }

    std::size_t TimeoutSweeper::sweep_once()
    {
        auto resolved = registry_.sweep_expired();
        spdlog::debug("timeout sweep: {} resolved, {} active", resolved, registry_.active_count());
        return resolved;
    }

} // namespace concord
