#include "concord/decision_registry.hpp"
#include "concord/consensus_evaluator.hpp"
#include "concord/crypto.hpp"
#include "concord/decision_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace concord
{

    namespace
    {
        DecisionStatus status_for(Outcome outcome)
        {
            switch (outcome)
            {
            case Outcome::Approved:
                return DecisionStatus::ConsensusReached;
            case Outcome::Rejected:
                return DecisionStatus::Rejected;
            case Outcome::Timeout:
                return DecisionStatus::Timeout;
            }
            return DecisionStatus::Timeout;
        }

        bool has_voted(const std::vector<Vote> &votes, const std::string &agent_id)
        {
            return std::any_of(votes.begin(), votes.end(),
                               [&agent_id](const Vote &v) { return v.agent_id == agent_id; });
        }
    } // namespace

    nlohmann::json EngineMetrics::to_json() const
    {
        return nlohmann::json{
            {"total_decisions", total_decisions},
            {"successful_decisions", successful_decisions},
            {"success_rate", success_rate},
            {"active_decisions", active_decisions},
            {"average_decision_time_seconds", average_decision_time_seconds},
            {"agent_participation", agent_participation},
            {"agent_weights", agent_weights},
            {"agent_reputation", agent_reputation}};
    }

    DecisionRegistry::DecisionRegistry(EngineSettings settings,
                                       std::shared_ptr<ReputationLedger> ledger,
                                       Collaborators collaborators)
        : settings_(settings),
          ledger_(std::move(ledger)),
          collaborators_(std::move(collaborators)),
          dispatcher_(collaborators_.executor, collaborators_.now ? collaborators_.now : NowFn{system_now})
    {
        if (!collaborators_.now)
            collaborators_.now = system_now;
        if (!ledger_)
            ledger_ = std::make_shared<ReputationLedger>();
    }

    Result<void> DecisionRegistry::validate_request(const DecisionRequest &request)
    {
        if (request.required_agents.empty())
            return std::unexpected(ConcordError::invalid_decision("A decision needs at least one required agent"));

        std::set<std::string> seen;
        for (const auto *agents : {&request.required_agents, &request.optional_agents})
        {
            for (const auto &agent : *agents)
            {
                if (agent.empty())
                    return std::unexpected(ConcordError::invalid_decision("Agent ids must not be empty"));
                if (!seen.insert(agent).second)
                    return std::unexpected(ConcordError::invalid_decision(std::format("Agent {} is listed more than once", agent)));
            }
        }

        if (request.timeout_seconds && *request.timeout_seconds <= 0)
            return std::unexpected(ConcordError::invalid_decision("timeout_seconds must be positive"));
        if (!(request.consensus_threshold >= 0.0 && request.consensus_threshold <= 1.0))
            return std::unexpected(ConcordError::invalid_decision("consensus_threshold must be within [0, 1]"));
        if (!request.options.is_array())
            return std::unexpected(ConcordError::invalid_decision("options must be a JSON array"));
        if (!request.metadata.is_object())
            return std::unexpected(ConcordError::invalid_decision("metadata must be a JSON object"));
        return {};
    }

    Result<std::string> DecisionRegistry::create(DecisionRequest request)
    {
        if (auto valid = validate_request(request); !valid)
            return std::unexpected(valid.error());

        auto now = collaborators_.now();
        auto entry = std::make_shared<ActiveDecision>();
        auto &d = entry->decision;
        d.decision_id = crypto::SecureRandom::uuid_v4();
        d.decision_type = std::move(request.decision_type);
        d.title = std::move(request.title);
        d.description = std::move(request.description);
        d.options = std::move(request.options);
        d.required_agents = std::move(request.required_agents);
        d.optional_agents = std::move(request.optional_agents);
        d.consensus_algorithm = request.consensus_algorithm;
        d.consensus_threshold = request.consensus_threshold;
        d.minimum_votes = ConsensusEvaluator::minimum_votes(d.consensus_algorithm, d.required_agents.size());
        d.timeout_seconds = request.timeout_seconds.value_or(settings_.timeout_for(request.priority));
        d.created_by = std::move(request.created_by);
        d.created_at = now;
        d.expires_at = now + std::chrono::seconds(d.timeout_seconds);
        d.metadata = std::move(request.metadata);
        d.status = DecisionStatus::Voting;
        d.priority = request.priority;

        // Stored and announced before it is published, so no vote on it can
        // be persisted or emitted ahead of the decision itself.
        persist(d);
        emit(DecisionEvent::make(event_types::kDecisionCreated, d.decision_id, now,
                                 {{"decision_type", d.decision_type},
                                  {"title", d.title},
                                  {"required_agents", d.required_agents},
                                  {"optional_agents", d.optional_agents},
                                  {"consensus_algorithm", to_string(d.consensus_algorithm)},
                                  {"minimum_votes", d.minimum_votes},
                                  {"timeout_seconds", d.timeout_seconds},
                                  {"created_by", d.created_by}}));

        // The entry is shared from here on; work from a copy.
        const Decision created = d;
        {
            std::unique_lock lock(active_mutex_);
            active_.emplace(created.decision_id, std::move(entry));
        }

        send_vote_requests(created);

        spdlog::info("decision created: {} ({}, {}, {} required, min {} votes)",
                     created.title, created.decision_id, to_string(created.consensus_algorithm),
                     created.required_agents.size(), created.minimum_votes);
        return created.decision_id;
    }

    Result<bool> DecisionRegistry::cast_vote(const std::string &decision_id,
                                             const std::string &agent_id,
                                             VoteType vote_type,
                                             double confidence,
                                             std::string reasoning,
                                             nlohmann::json metadata)
    {
        if (!(confidence >= 0.0 && confidence <= 1.0))
            return std::unexpected(ConcordError::invalid_input(std::format("confidence must be within [0, 1], got {}", confidence)));
        if (!metadata.is_object())
            return std::unexpected(ConcordError::invalid_input("vote metadata must be a JSON object"));

        auto entry = find_active(decision_id);
        if (!entry)
        {
            if (find_result(decision_id))
                return std::unexpected(ConcordError::invalid_state(std::format("Decision {} is already resolved", decision_id)));
            return std::unexpected(ConcordError::not_found(std::format("Decision {} not found", decision_id)));
        }

        Vote vote;
        std::size_t vote_count = 0;
        std::optional<Resolution> resolution;
        {
            std::lock_guard lock(entry->mutex);
            auto &d = entry->decision;

            if (d.status != DecisionStatus::Voting)
            {
                return std::unexpected(ConcordError::invalid_state(
                    std::format("Decision {} is not in voting state ({})", decision_id, to_string(d.status))));
            }

            auto now = collaborators_.now();
            if (now > d.expires_at)
            {
                resolution = resolve_locked(*entry, Outcome::Timeout, false);
            }
            else
            {
                if (!d.is_eligible(agent_id))
                {
                    return std::unexpected(ConcordError::ineligible_agent(
                        std::format("Agent {} is not eligible to vote on decision {}", agent_id, decision_id)));
                }

                if (has_voted(entry->votes, agent_id))
                {
                    return std::unexpected(ConcordError::duplicate_vote(
                        std::format("Agent {} has already voted on decision {}", agent_id, decision_id)));
                }

                vote = Vote{
                    crypto::SecureRandom::uuid_v4(),
                    decision_id,
                    agent_id,
                    vote_type,
                    confidence,
                    std::move(reasoning),
                    std::move(metadata),
                    now,
                    ledger_->get_weight(agent_id)};

                entry->votes.push_back(vote);
                vote_count = entry->votes.size();

                auto evaluation = ConsensusEvaluator::evaluate(entry->votes, d);
                if (evaluation.resolved && evaluation.outcome)
                    resolution = resolve_locked(*entry, *evaluation.outcome, true);
            }
        }

        if (vote_count == 0)
        {
            if (resolution)
                finish(std::move(*resolution));
            return std::unexpected(ConcordError::expired(std::format("Decision {} has expired", decision_id)));
        }

        persist(vote);
        emit(DecisionEvent::make(event_types::kVoteCast, decision_id, vote.timestamp,
                                 {{"agent_id", agent_id},
                                  {"vote_type", to_string(vote_type)},
                                  {"confidence", confidence},
                                  {"weight", vote.weight},
                                  {"vote_count", vote_count}}));

        spdlog::info("vote cast by {} for decision {}: {} (weight {:.3f})",
                     agent_id, decision_id, to_string(vote_type), vote.weight);

        if (resolution)
            finish(std::move(*resolution));
        return true;
    }

    Result<DecisionStatusView> DecisionRegistry::get_status(const std::string &decision_id) const
    {
        if (auto entry = find_active(decision_id))
        {
            std::lock_guard lock(entry->mutex);
            if (!is_terminal(entry->decision.status))
                return DecisionStatusView{LiveStatus::from_votes(entry->decision, entry->votes, collaborators_.now())};
        }

        if (auto result = find_result(decision_id))
            return DecisionStatusView{std::move(*result)};

        return std::unexpected(ConcordError::not_found(std::format("Decision {} not found", decision_id)));
    }

    EngineMetrics DecisionRegistry::get_metrics() const
    {
        EngineMetrics m;

        std::vector<std::shared_ptr<ActiveDecision>> entries;
        {
            std::shared_lock lock(active_mutex_);
            entries.reserve(active_.size());
            for (const auto &[_, entry] : active_)
                entries.push_back(entry);
        }

        for (const auto &entry : entries)
        {
            std::lock_guard lock(entry->mutex);
            if (is_terminal(entry->decision.status))
                continue; // counted through history
            ++m.active_decisions;
            for (const auto &v : entry->votes)
                m.agent_participation[v.agent_id] += 1;
        }

        double total_seconds = 0.0;
        {
            std::shared_lock lock(history_mutex_);
            m.total_decisions = history_.size();
            for (const auto &[_, result] : history_)
            {
                for (const auto &v : result.votes)
                    m.agent_participation[v.agent_id] += 1;
                if (result.consensus_reached)
                {
                    ++m.successful_decisions;
                    total_seconds += std::chrono::duration<double>(result.completed_at - result.created_at).count();
                }
            }
        }

        m.success_rate = static_cast<double>(m.successful_decisions) /
                         static_cast<double>(std::max<std::size_t>(m.total_decisions, 1));
        if (m.successful_decisions > 0)
            m.average_decision_time_seconds = total_seconds / static_cast<double>(m.successful_decisions);

        for (const auto &rec : ledger_->snapshot())
        {
            m.agent_weights[rec.agent_id] = rec.weight;
            m.agent_reputation[rec.agent_id] = rec.reputation;
        }
        return m;
    }

    std::size_t DecisionRegistry::sweep_expired()
    {
        std::vector<std::shared_ptr<ActiveDecision>> entries;
        {
            std::shared_lock lock(active_mutex_);
            entries.reserve(active_.size());
            for (const auto &[_, entry] : active_)
                entries.push_back(entry);
        }

        std::size_t resolved = 0;
        auto now = collaborators_.now();
        for (const auto &entry : entries)
        {
            std::optional<Resolution> resolution;
            {
                std::lock_guard lock(entry->mutex);
                if (entry->decision.status != DecisionStatus::Voting || !(now > entry->decision.expires_at))
                    continue;
                resolution = resolve_locked(*entry, Outcome::Timeout, false);
            }
            if (resolution)
            {
                finish(std::move(*resolution));
                ++resolved;
            }
        }

        if (resolved > 0)
            spdlog::info("timeout sweep resolved {} decision(s)", resolved);
        return resolved;
    }

    Result<std::size_t> DecisionRegistry::recover()
    {
        auto &store = collaborators_.store;
        if (!store)
            return std::size_t{0};

        auto agents = store->list_agents();
        if (!agents)
            return std::unexpected(agents.error());
        for (const auto &rec : *agents)
            ledger_->seed(rec.agent_id, rec.reputation);

        auto results = store->list_results();
        if (!results)
            return std::unexpected(results.error());
        {
            std::unique_lock lock(history_mutex_);
            for (auto &r : *results)
                history_.emplace(r.decision_id, std::move(r));
        }

        auto decisions = store->list_decisions();
        if (!decisions)
            return std::unexpected(decisions.error());

        std::size_t reopened = 0;
        for (auto &d : *decisions)
        {
            if (find_result(d.decision_id))
                continue;
            if (is_terminal(d.status))
            {
                spdlog::warn("decision {} is {} in storage but has no result; leaving it closed",
                             d.decision_id, to_string(d.status));
                continue;
            }

            auto votes = store->list_votes(d.decision_id);
            if (!votes)
                return std::unexpected(votes.error());

            auto entry = std::make_shared<ActiveDecision>();
            entry->decision = std::move(d);
            entry->decision.status = DecisionStatus::Voting;
            entry->votes = std::move(*votes);
            std::sort(entry->votes.begin(), entry->votes.end(),
                      [](const Vote &a, const Vote &b) { return a.timestamp < b.timestamp; });

            std::unique_lock lock(active_mutex_);
            if (active_.emplace(entry->decision.decision_id, entry).second)
                ++reopened;
        }

        spdlog::info("recovered {} active decision(s), {} result(s), {} agent record(s)",
                     reopened, results->size(), agents->size());
        return reopened;
    }

    std::size_t DecisionRegistry::active_count() const
    {
        std::shared_lock lock(active_mutex_);
        return active_.size();
    }

    std::size_t DecisionRegistry::history_count() const
    {
        std::shared_lock lock(history_mutex_);
        return history_.size();
    }

    std::shared_ptr<DecisionRegistry::ActiveDecision> DecisionRegistry::find_active(const std::string &decision_id) const
    {
        std::shared_lock lock(active_mutex_);
        auto it = active_.find(decision_id);
        if (it == active_.end())
            return nullptr;
        return it->second;
    }

    std::optional<DecisionResult> DecisionRegistry::find_result(const std::string &decision_id) const
    {
        std::shared_lock lock(history_mutex_);
        auto it = history_.find(decision_id);
        if (it == history_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<DecisionRegistry::Resolution> DecisionRegistry::resolve_locked(ActiveDecision &entry,
                                                                                Outcome outcome,
                                                                                bool consensus_reached)
    {
        auto &d = entry.decision;
        if (d.status != DecisionStatus::Voting)
            return std::nullopt;

        auto result = DecisionResult::from_votes(d, entry.votes, outcome, consensus_reached, collaborators_.now());
        d.status = status_for(outcome);

        auto touched = ledger_->on_decision_resolved(d, entry.votes, result);

        // History first, so a reader that misses the active entry finds the result.
        {
            std::unique_lock lock(history_mutex_);
            history_.emplace(d.decision_id, result);
        }
        {
            std::unique_lock lock(active_mutex_);
            active_.erase(d.decision_id);
        }

        return Resolution{d, std::move(result), std::move(touched)};
    }

    void DecisionRegistry::finish(Resolution resolution)
    {
        const auto &d = resolution.decision;
        auto &result = resolution.result;

        dispatcher_.dispatch(d, result);
        {
            std::unique_lock lock(history_mutex_);
            history_.insert_or_assign(d.decision_id, result);
        }

        persist(d);
        persist(result);
        persist(resolution.touched);

        emit(DecisionEvent::make(event_types::kDecisionCompleted, d.decision_id, result.completed_at,
                                 {{"final_decision", to_string(result.final_decision)},
                                  {"consensus_reached", result.consensus_reached},
                                  {"vote_count", result.vote_count},
                                  {"approval_percentage", result.approval_percentage},
                                  {"execution_status", to_string(result.execution_status)}}));

        spdlog::info("decision completed: {} - {} (consensus: {})",
                     d.decision_id, to_string(result.final_decision), result.consensus_reached);
    }

    void DecisionRegistry::send_vote_requests(const Decision &decision)
    {
        if (!collaborators_.messenger)
            return;

        nlohmann::json base = {
            {"decision_id", decision.decision_id},
            {"title", decision.title},
            {"description", decision.description},
            {"options", decision.options},
            {"timeout_seconds", decision.timeout_seconds},
            {"consensus_algorithm", to_string(decision.consensus_algorithm)},
            {"metadata", decision.metadata}};

        auto send = [&](const std::string &agent_id, bool required) {
            nlohmann::json payload = base;
            payload["subject"] = std::format("{}: {}", required ? "Consensus Required" : "Optional Vote", decision.title);
            payload["priority"] = (required && decision.priority == Priority::Critical) ? "high" : "medium";
            payload["response_required"] = required;
            payload["optional"] = !required;

            auto sent = collaborators_.messenger->send_vote_request(
                decision.decision_id, agent_id, payload, required, std::chrono::seconds(decision.timeout_seconds));
            if (!sent)
            {
                spdlog::warn("vote request for decision {} to {} failed: {}",
                             decision.decision_id, agent_id, sent.error().what());
            }
        };

        for (const auto &agent : decision.required_agents)
            send(agent, true);
        for (const auto &agent : decision.optional_agents)
            send(agent, false);
    }

    void DecisionRegistry::persist(const Decision &decision)
    {
        if (!collaborators_.store)
            return;
        if (auto res = collaborators_.store->upsert_decision(decision); !res)
            spdlog::error("failed to persist decision {}: {}", decision.decision_id, res.error().what());
    }

    void DecisionRegistry::persist(const Vote &vote)
    {
        if (!collaborators_.store)
            return;
        if (auto res = collaborators_.store->upsert_vote(vote); !res)
            spdlog::error("failed to persist vote {} on {}: {}", vote.vote_id, vote.decision_id, res.error().what());
    }

    void DecisionRegistry::persist(const DecisionResult &result)
    {
        if (!collaborators_.store)
            return;
        if (auto res = collaborators_.store->upsert_result(result); !res)
            spdlog::error("failed to persist result of {}: {}", result.decision_id, res.error().what());
    }

    void DecisionRegistry::persist(const std::vector<AgentReputation> &agents)
    {
        if (!collaborators_.store)
            return;
        for (const auto &rec : agents)
        {
            if (auto res = collaborators_.store->upsert_agent(rec); !res)
                spdlog::error("failed to persist reputation of {}: {}", rec.agent_id, res.error().what());
        }
    }

    void DecisionRegistry::emit(const DecisionEvent &event)
    {
        if (!collaborators_.events)
            return;
        if (auto res = collaborators_.events->emit(event); !res)
            spdlog::warn("event {} for {} not delivered: {}", event.event_type, event.decision_id, res.error().what());
    }

} // namespace concord
