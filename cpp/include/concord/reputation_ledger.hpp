#pragma once

#include "config.hpp"
#include "decision.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace concord
{

    struct AgentReputation
    {
        std::string agent_id;
        double reputation{1.0}; // [0.0, 1.0]
        double weight{1.0};     // 0.5 + reputation * 0.5

        static double weight_for(double reputation);
        static AgentReputation make(std::string agent_id, double reputation);

        nlohmann::json to_json() const;
        static Result<AgentReputation> from_json(const nlohmann::json &j);
    };

    /**
     * Process-wide agent reputation and voting weight.
     *
     * Reads (weight snapshots at vote time) take a shared lock; resolution
     * updates and decay take the exclusive lock so concurrent resolutions
     * touching the same agent never lose updates. Unknown agents start at
     * reputation 1.0.
     */
    class ReputationLedger
    {
    public:
        ReputationLedger();
        explicit ReputationLedger(ReputationRules rules);

        double get_weight(std::string_view agent_id) const;
        double get_reputation(std::string_view agent_id) const;

        /** Set an agent's starting reputation (clamped to [0, 1]) */
        void seed(const std::string &agent_id, double reputation);

        /**
         * Apply participation and correctness rules for a resolved decision.
         * Returns the updated records of every touched agent.
         */
        std::vector<AgentReputation> on_decision_resolved(const Decision &decision,
                                                          const std::vector<Vote> &votes,
                                                          const DecisionResult &result);

        /** Multiply every reputation by factor (clamped to [0, 1]); returns updated records */
        std::vector<AgentReputation> decay_all(double factor);

        std::vector<AgentReputation> snapshot() const;

    private:
        AgentReputation &entry_locked(const std::string &agent_id);
        void adjust_locked(const std::string &agent_id, double delta);

        ReputationRules rules_;
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, AgentReputation> agents_;
    };

} // namespace concord
