#include "concord/engine.hpp"
#include "concord/decision_store.hpp"
#include <spdlog/spdlog.h>

namespace concord
{

    ConsensusEngine::ConsensusEngine(EngineConfig config, Collaborators collaborators)
        : config_(std::move(config)),
          collaborators_(std::move(collaborators)),
          ledger_(std::make_shared<ReputationLedger>(config_.reputation.rules))
    {
        registry_ = std::make_unique<DecisionRegistry>(config_.engine, ledger_, collaborators_);
        sweeper_ = std::make_unique<TimeoutSweeper>(
            *registry_, std::chrono::seconds(config_.engine.sweep_interval_seconds));
        decay_worker_ = std::make_unique<PeriodicWorker>(
            "reputation-decay",
            std::chrono::seconds(config_.reputation.decay_interval_seconds),
            [this] { decay_reputation(); });
    }

    ConsensusEngine::~ConsensusEngine()
    {
        shutdown();
    }

    Result<void> ConsensusEngine::initialize()
    {
        if (initialized_)
            return {};

        for (const auto &s : config_.reputation.seed)
            ledger_->seed(s.agent_id, s.reputation);

        auto recovered = registry_->recover();
        if (!recovered)
        {
            spdlog::error("state recovery failed: {}", recovered.error().what());
            return std::unexpected(recovered.error());
        }

        sweeper_->start();
        decay_worker_->start();
        initialized_ = true;

        spdlog::info("consensus engine initialized ({} agents seeded, {} decisions recovered, sweep every {}s)",
                     config_.reputation.seed.size(), *recovered, config_.engine.sweep_interval_seconds);
        return {};
    }

    void ConsensusEngine::shutdown()
    {
        sweeper_->stop();
        decay_worker_->stop();
        if (initialized_.exchange(false))
            spdlog::info("consensus engine shut down");
    }

    Result<std::string> ConsensusEngine::create_decision(DecisionRequest request)
    {
        return registry_->create(std::move(request));
    }

    Result<bool> ConsensusEngine::cast_vote(const std::string &decision_id,
                                            const std::string &agent_id,
                                            VoteType vote_type,
                                            double confidence,
                                            std::string reasoning,
                                            nlohmann::json metadata)
    {
        return registry_->cast_vote(decision_id, agent_id, vote_type, confidence,
                                    std::move(reasoning), std::move(metadata));
    }

    Result<DecisionStatusView> ConsensusEngine::get_decision_status(const std::string &decision_id) const
    {
        return registry_->get_status(decision_id);
    }

    EngineMetrics ConsensusEngine::get_metrics() const
    {
        return registry_->get_metrics();
    }

    void ConsensusEngine::decay_reputation()
    {
        auto updated = ledger_->decay_all(config_.reputation.decay_factor);
        spdlog::debug("reputation decay x{} applied to {} agent(s)", config_.reputation.decay_factor, updated.size());

        if (!collaborators_.store)
            return;
        for (const auto &rec : updated)
        {
            if (auto res = collaborators_.store->upsert_agent(rec); !res)
                spdlog::error("failed to persist reputation of {}: {}", rec.agent_id, res.error().what());
        }
    }

} // namespace concord
