#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "decision.hpp"
#include "decision_registry.hpp"
#include "periodic_worker.hpp"
#include "reputation_ledger.hpp"
#include "timeout_sweeper.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace concord
{

    /**
     * ConsensusEngine wires the decision registry, reputation ledger and the
     * two background workers (timeout sweep, reputation decay) to the
     * injected collaborators. One instance per process is typical but not
     * required; nothing is global.
     */
    class ConsensusEngine
    {
    public:
        ConsensusEngine(EngineConfig config, Collaborators collaborators);
        ~ConsensusEngine();

        ConsensusEngine(const ConsensusEngine &) = delete;
        ConsensusEngine &operator=(const ConsensusEngine &) = delete;

        /** Seed reputation, recover stored state and start the workers. */
        Result<void> initialize();

        /** Stop the workers. Safe to call more than once. */
        void shutdown();

        Result<std::string> create_decision(DecisionRequest request);

        Result<bool> cast_vote(const std::string &decision_id,
                               const std::string &agent_id,
                               VoteType vote_type,
                               double confidence,
                               std::string reasoning,
                               nlohmann::json metadata = nlohmann::json::object());

        Result<DecisionStatusView> get_decision_status(const std::string &decision_id) const;

        EngineMetrics get_metrics() const;

        /** Apply one decay step and persist the new reputations. */
        void decay_reputation();

        bool initialized() const { return initialized_; }

        const EngineConfig &config() const { return config_; }
        DecisionRegistry &registry() { return *registry_; }
        ReputationLedger &ledger() { return *ledger_; }

    private:
        EngineConfig config_;
        Collaborators collaborators_;
        std::shared_ptr<ReputationLedger> ledger_;
        std::unique_ptr<DecisionRegistry> registry_;
        std::unique_ptr<TimeoutSweeper> sweeper_;
        std::unique_ptr<PeriodicWorker> decay_worker_;
        std::atomic<bool> initialized_{false};
    };

} // namespace concord
