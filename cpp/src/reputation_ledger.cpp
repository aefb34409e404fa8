#include "concord/reputation_ledger.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <set>

namespace concord
{

    namespace
    {
        // NaN maps to 0 so a bad input cannot leave [0, 1].
        double clamp_unit(double v)
        {
            if (std::isnan(v))
                return 0.0;
            return std::clamp(v, 0.0, 1.0);
        }

        bool matches_outcome(VoteType vote, Outcome outcome)
        {
            return (vote == VoteType::Approve && outcome == Outcome::Approved) ||
                   (vote == VoteType::Reject && outcome == Outcome::Rejected);
        }
    } // namespace

    double AgentReputation::weight_for(double reputation)
    {
        return 0.5 + clamp_unit(reputation) * 0.5;
    }

    AgentReputation AgentReputation::make(std::string agent_id, double reputation)
    {
        double r = clamp_unit(reputation);
        return AgentReputation{std::move(agent_id), r, weight_for(r)};
    }

    nlohmann::json AgentReputation::to_json() const
    {
        return nlohmann::json{
            {"agent_id", agent_id},
            {"reputation", reputation},
            {"weight", weight}};
    }

    Result<AgentReputation> AgentReputation::from_json(const nlohmann::json &j)
    {
        try
        {
            return make(j.at("agent_id").get<std::string>(), j.at("reputation").get<double>());
        }
        catch (const std::exception &e)
        {
            return std::unexpected(ConcordError::parsing(std::string("Invalid agent reputation JSON: ") + e.what()));
        }
    }

    ReputationLedger::ReputationLedger() : rules_{} {}

    ReputationLedger::ReputationLedger(ReputationRules rules) : rules_(rules) {}

    double ReputationLedger::get_weight(std::string_view agent_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = agents_.find(std::string(agent_id));
        if (it == agents_.end())
            return AgentReputation::weight_for(1.0);
        return it->second.weight;
    }

    double ReputationLedger::get_reputation(std::string_view agent_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = agents_.find(std::string(agent_id));
        if (it == agents_.end())
            return 1.0;
        return it->second.reputation;
    }

    void ReputationLedger::seed(const std::string &agent_id, double reputation)
    {
        std::unique_lock lock(mutex_);
        agents_[agent_id] = AgentReputation::make(agent_id, reputation);
    }

    AgentReputation &ReputationLedger::entry_locked(const std::string &agent_id)
    {
        auto it = agents_.find(agent_id);
        if (it == agents_.end())
            it = agents_.emplace(agent_id, AgentReputation::make(agent_id, 1.0)).first;
        return it->second;
    }

    void ReputationLedger::adjust_locked(const std::string &agent_id, double delta)
    {
        auto &rec = entry_locked(agent_id);
        rec.reputation = clamp_unit(rec.reputation + delta);
        rec.weight = AgentReputation::weight_for(rec.reputation);
    }

    std::vector<AgentReputation> ReputationLedger::on_decision_resolved(const Decision &decision,
                                                                        const std::vector<Vote> &votes,
                                                                        const DecisionResult &result)
    {
        std::set<std::string> touched;
        std::unique_lock lock(mutex_);

        for (const auto &agent : decision.required_agents)
        {
            bool voted = std::any_of(votes.begin(), votes.end(),
                                     [&agent](const Vote &v) { return v.agent_id == agent; });
            adjust_locked(agent, voted ? rules_.participation_reward : -rules_.participation_penalty);
            touched.insert(agent);
        }

        for (const auto &vote : votes)
        {
            bool correct = result.consensus_reached && matches_outcome(vote.vote_type, result.final_decision);
            adjust_locked(vote.agent_id, correct ? rules_.correct_vote_reward : -rules_.incorrect_vote_penalty);
            touched.insert(vote.agent_id);
        }

        std::vector<AgentReputation> out;
        out.reserve(touched.size());
        for (const auto &agent : touched)
            out.push_back(agents_.at(agent));
        return out;
    }

    std::vector<AgentReputation> ReputationLedger::decay_all(double factor)
    {
        // A factor that is not a number leaves reputations unchanged.
        double f = std::isnan(factor) ? 1.0 : clamp_unit(factor);
        std::vector<AgentReputation> out;

        std::unique_lock lock(mutex_);
        out.reserve(agents_.size());
        for (auto &[_, rec] : agents_)
        {
            rec.reputation = clamp_unit(rec.reputation * f);
            rec.weight = AgentReputation::weight_for(rec.reputation);
            out.push_back(rec);
        }
        return out;
    }

    std::vector<AgentReputation> ReputationLedger::snapshot() const
    {
        std::vector<AgentReputation> out;
        std::shared_lock lock(mutex_);
        out.reserve(agents_.size());
        for (const auto &[_, rec] : agents_)
            out.push_back(rec);
        std::sort(out.begin(), out.end(),
                  [](const AgentReputation &a, const AgentReputation &b) { return a.agent_id < b.agent_id; });
        return out;
    }

} // namespace concord
