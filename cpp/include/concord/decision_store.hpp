#pragma once

#include "config.hpp"
#include "decision.hpp"
#include "reputation_ledger.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace concord
{

    /**
     * Abstract interface for durable decision storage.
     * All writes are idempotent upserts keyed by record id, so any write may
     * be retried safely.
     */
    class DecisionStore
    {
    public:
        virtual ~DecisionStore() = default;

        virtual Result<void> upsert_decision(const Decision &decision) = 0;

        /** Keyed by (decision_id, agent_id); one vote per agent per decision */
        virtual Result<void> upsert_vote(const Vote &vote) = 0;

        virtual Result<void> upsert_result(const DecisionResult &result) = 0;

        virtual Result<void> upsert_agent(const AgentReputation &agent) = 0;

        virtual Result<std::vector<Decision>> list_decisions() = 0;

        virtual Result<std::vector<Vote>> list_votes(const std::string &decision_id) = 0;

        virtual Result<std::vector<DecisionResult>> list_results() = 0;

        virtual Result<std::vector<AgentReputation>> list_agents() = 0;
    };

    /**
     * RocksDB-backed DecisionStore. Values are JSON documents under the key
     * prefixes decision:, vote:<decision_id>:, result: and agent:.
     * Throws if the database cannot be opened.
     */
    class RocksDbDecisionStore : public DecisionStore
    {
    public:
        explicit RocksDbDecisionStore(const StorageConfig &cfg);
        ~RocksDbDecisionStore() override;

        Result<void> upsert_decision(const Decision &decision) override;
        Result<void> upsert_vote(const Vote &vote) override;
        Result<void> upsert_result(const DecisionResult &result) override;
        Result<void> upsert_agent(const AgentReputation &agent) override;

        Result<std::vector<Decision>> list_decisions() override;
        Result<std::vector<Vote>> list_votes(const std::string &decision_id) override;
        Result<std::vector<DecisionResult>> list_results() override;
        Result<std::vector<AgentReputation>> list_agents() override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace concord
