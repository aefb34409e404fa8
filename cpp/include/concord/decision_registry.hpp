#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "decision.hpp"
#include "events.hpp"
#include "outcome_dispatcher.hpp"
#include "reputation_ledger.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace concord
{

    struct EngineMetrics
    {
        std::size_t total_decisions{0};
        std::size_t successful_decisions{0};
        double success_rate{0.0};
        std::size_t active_decisions{0};
        double average_decision_time_seconds{0.0};
        std::map<std::string, std::size_t> agent_participation;
        std::map<std::string, double> agent_weights;
        std::map<std::string, double> agent_reputation;

        nlohmann::json to_json() const;
    };

    /**
     * Owns the lifecycle of active decisions and their vote ledgers.
     *
     * Locking: active_mutex_ guards only the id -> entry map and is never
     * held while waiting on an entry's mutex. Each entry's mutex serializes
     * vote append, evaluation and resolution for that decision alone.
     * Resolution is a check-and-set on the entry's status, so the vote-time
     * expiry path and the sweeper cannot both resolve one decision.
     *
     * No collaborator (messenger, executor, event sink, store) is called
     * while an entry's mutex is held. The state transition happens under the
     * lock and yields a Resolution that is finished after unlocking.
     */
    class DecisionRegistry
    {
    public:
        DecisionRegistry(EngineSettings settings,
                         std::shared_ptr<ReputationLedger> ledger,
                         Collaborators collaborators);

        /** Create a decision, request votes and open it for voting. Returns the decision id. */
        Result<std::string> create(DecisionRequest request);

        /**
         * Record agent_id's vote. Evaluates quorum synchronously, so the
         * decision may resolve within this call.
         */
        Result<bool> cast_vote(const std::string &decision_id,
                               const std::string &agent_id,
                               VoteType vote_type,
                               double confidence,
                               std::string reasoning,
                               nlohmann::json metadata = nlohmann::json::object());

        Result<DecisionStatusView> get_status(const std::string &decision_id) const;

        EngineMetrics get_metrics() const;

        /** Resolve every voting decision whose deadline has passed. Returns how many were resolved. */
        std::size_t sweep_expired();

        /**
         * Reload reputation, results and unresolved decisions from the store.
         * Returns the number of decisions reopened for voting.
         */
        Result<std::size_t> recover();

        std::size_t active_count() const;
        std::size_t history_count() const;

    private:
        struct ActiveDecision
        {
            std::mutex mutex;
            Decision decision;
            std::vector<Vote> votes;
        };

        static Result<void> validate_request(const DecisionRequest &request);

        std::shared_ptr<ActiveDecision> find_active(const std::string &decision_id) const;
        std::optional<DecisionResult> find_result(const std::string &decision_id) const;

        /** A resolved decision whose dispatch, persistence and events are still due. */
        struct Resolution
        {
            Decision decision;
            DecisionResult result;
            std::vector<AgentReputation> touched;
        };

        /**
         * Caller holds entry.mutex. Moves the decision out of Voting, applies
         * the reputation rules and files the result in history. Returns
         * nullopt if the decision already left Voting.
         */
        std::optional<Resolution> resolve_locked(ActiveDecision &entry, Outcome outcome, bool consensus_reached);

        /** Runs the executor, records its outcome, persists and emits. Caller holds no entry lock. */
        void finish(Resolution resolution);

        void send_vote_requests(const Decision &decision);
        void persist(const Decision &decision);
        void persist(const Vote &vote);
        void persist(const DecisionResult &result);
        void persist(const std::vector<AgentReputation> &agents);
        void emit(const DecisionEvent &event);

        EngineSettings settings_;
        std::shared_ptr<ReputationLedger> ledger_;
        Collaborators collaborators_;
        OutcomeDispatcher dispatcher_;

        mutable std::shared_mutex active_mutex_;
        std::unordered_map<std::string, std::shared_ptr<ActiveDecision>> active_;

        mutable std::shared_mutex history_mutex_;
        std::unordered_map<std::string, DecisionResult> history_;
    };

} // namespace concord
