#include "concord/decision.hpp"
#include <algorithm>

namespace concord
{

    using Json = nlohmann::json;

    namespace
    {
        constexpr VoteType kAllVoteTypes[] = {
            VoteType::Approve,
            VoteType::Reject,
            VoteType::Abstain,
            VoteType::Conditional};

        template <typename T>
        T unwrap_enum(std::expected<T, std::string> parsed)
        {
            if (!parsed)
                throw std::invalid_argument(parsed.error());
            return *parsed;
        }

        TimePoint unwrap_time(const Json &j, const char *key)
        {
            auto parsed = parse_iso8601(j.at(key).get<std::string>());
            if (!parsed)
                throw std::invalid_argument(parsed.error().what());
            return *parsed;
        }

        bool contains(const std::vector<std::string> &agents, std::string_view agent_id)
        {
            return std::find(agents.begin(), agents.end(), agent_id) != agents.end();
        }
    } // namespace

    // ========== Vote ==========

    Json Vote::to_json() const
    {
        return Json{
            {"vote_id", vote_id},
            {"decision_id", decision_id},
            {"agent_id", agent_id},
            {"vote_type", to_string(vote_type)},
            {"confidence", confidence},
            {"reasoning", reasoning},
            {"metadata", metadata},
            {"timestamp", to_iso8601(timestamp)},
            {"weight", weight}};
    }

    Result<Vote> Vote::from_json(const Json &j)
    {
        try
        {
            Vote vote;
            vote.vote_id = j.at("vote_id").get<std::string>();
            vote.decision_id = j.at("decision_id").get<std::string>();
            vote.agent_id = j.at("agent_id").get<std::string>();
            vote.vote_type = unwrap_enum(vote_type_from_string(j.at("vote_type").get<std::string>()));
            vote.confidence = j.value("confidence", 0.0);
            vote.reasoning = j.value("reasoning", "");
            vote.metadata = j.value("metadata", Json::object());
            vote.timestamp = unwrap_time(j, "timestamp");
            vote.weight = j.value("weight", 1.0);
            return vote;
        }
        catch (const std::exception &e)
        {
            return std::unexpected(ConcordError::parsing(std::string("Invalid vote JSON: ") + e.what()));
        }
    }

    // ========== DecisionRequest ==========

    Result<DecisionRequest> DecisionRequest::from_json(const Json &j)
    {
        try
        {
            DecisionRequest req;
            req.decision_type = j.at("decision_type").get<std::string>();
            req.title = j.at("title").get<std::string>();
            req.description = j.value("description", "");
            req.options = j.value("options", Json::array());
            req.required_agents = j.at("required_agents").get<std::vector<std::string>>();
            req.optional_agents = j.value("optional_agents", std::vector<std::string>{});
            if (j.contains("consensus_algorithm"))
                req.consensus_algorithm = unwrap_enum(algorithm_from_string(j.at("consensus_algorithm").get<std::string>()));
            req.consensus_threshold = j.value("consensus_threshold", 0.5);
            if (j.contains("timeout_seconds") && !j.at("timeout_seconds").is_null())
                req.timeout_seconds = j.at("timeout_seconds").get<std::int64_t>();
            if (j.contains("priority"))
                req.priority = unwrap_enum(priority_from_string(j.at("priority").get<std::string>()));
            req.created_by = j.value("created_by", "");
            req.metadata = j.value("metadata", Json::object());
            return req;
        }
        catch (const std::exception &e)
        {
            return std::unexpected(ConcordError::invalid_decision(std::string("Malformed decision request: ") + e.what()));
        }
    }

    // ========== Decision ==========

    bool Decision::is_required(std::string_view agent_id) const
    {
        return contains(required_agents, agent_id);
    }

    bool Decision::is_eligible(std::string_view agent_id) const
    {
        return contains(required_agents, agent_id) || contains(optional_agents, agent_id);
    }

    std::vector<std::string> Decision::eligible_agents() const
    {
        std::vector<std::string> all = required_agents;
        all.insert(all.end(), optional_agents.begin(), optional_agents.end());
        return all;
    }

    Json Decision::to_json() const
    {
        return Json{
            {"decision_id", decision_id},
            {"decision_type", decision_type},
            {"title", title},
            {"description", description},
            {"options", options},
            {"required_agents", required_agents},
            {"optional_agents", optional_agents},
            {"consensus_algorithm", to_string(consensus_algorithm)},
            {"consensus_threshold", consensus_threshold},
            {"minimum_votes", minimum_votes},
            {"timeout_seconds", timeout_seconds},
            {"created_by", created_by},
            {"created_at", to_iso8601(created_at)},
            {"expires_at", to_iso8601(expires_at)},
            {"metadata", metadata},
            {"status", to_string(status)},
            {"priority", to_string(priority)}};
    }

    Result<Decision> Decision::from_json(const Json &j)
    {
        try
        {
            Decision d;
            d.decision_id = j.at("decision_id").get<std::string>();
            d.decision_type = j.at("decision_type").get<std::string>();
            d.title = j.at("title").get<std::string>();
            d.description = j.value("description", "");
            d.options = j.value("options", Json::array());
            d.required_agents = j.at("required_agents").get<std::vector<std::string>>();
            d.optional_agents = j.value("optional_agents", std::vector<std::string>{});
            d.consensus_algorithm = unwrap_enum(algorithm_from_string(j.at("consensus_algorithm").get<std::string>()));
            d.consensus_threshold = j.value("consensus_threshold", 0.5);
            d.minimum_votes = j.at("minimum_votes").get<std::size_t>();
            d.timeout_seconds = j.at("timeout_seconds").get<std::int64_t>();
            d.created_by = j.value("created_by", "");
            d.created_at = unwrap_time(j, "created_at");
            d.expires_at = unwrap_time(j, "expires_at");
            d.metadata = j.value("metadata", Json::object());
            d.status = unwrap_enum(decision_status_from_string(j.at("status").get<std::string>()));
            d.priority = unwrap_enum(priority_from_string(j.value("priority", "medium")));
            return d;
        }
        catch (const std::exception &e)
        {
            return std::unexpected(ConcordError::parsing(std::string("Invalid decision JSON: ") + e.what()));
        }
    }

    // ========== DecisionResult ==========

    DecisionResult DecisionResult::from_votes(const Decision &decision,
                                              const std::vector<Vote> &votes,
                                              Outcome final_decision,
                                              bool consensus_reached,
                                              TimePoint completed_at)
    {
        DecisionResult result;
        result.decision_id = decision.decision_id;
        result.final_decision = final_decision;
        result.consensus_reached = consensus_reached;
        result.vote_count = votes.size();

        auto approvals = std::count_if(votes.begin(), votes.end(),
                                       [](const Vote &v) { return v.vote_type == VoteType::Approve; });
        result.approval_percentage =
            static_cast<double>(approvals) / static_cast<double>(std::max<std::size_t>(votes.size(), 1)) * 100.0;

        for (const auto &v : votes)
            result.participating_agents.push_back(v.agent_id);
        for (const auto &agent : decision.eligible_agents())
        {
            if (!contains(result.participating_agents, agent))
                result.non_participating_agents.push_back(agent);
        }

        result.votes = votes;
        result.created_at = decision.created_at;
        result.completed_at = completed_at;
        result.metadata = decision.metadata;
        return result;
    }

    Json DecisionResult::to_json() const
    {
        Json vote_list = Json::array();
        for (const auto &v : votes)
            vote_list.push_back(v.to_json());

        return Json{
            {"decision_id", decision_id},
            {"final_decision", to_string(final_decision)},
            {"consensus_reached", consensus_reached},
            {"vote_count", vote_count},
            {"approval_percentage", approval_percentage},
            {"participating_agents", participating_agents},
            {"non_participating_agents", non_participating_agents},
            {"votes", vote_list},
            {"execution_status", to_string(execution_status)},
            {"execution_details", execution_details},
            {"created_at", to_iso8601(created_at)},
            {"completed_at", to_iso8601(completed_at)},
            {"metadata", metadata}};
    }

    Result<DecisionResult> DecisionResult::from_json(const Json &j)
    {
        try
        {
            DecisionResult r;
            r.decision_id = j.at("decision_id").get<std::string>();
            r.final_decision = unwrap_enum(outcome_from_string(j.at("final_decision").get<std::string>()));
            r.consensus_reached = j.at("consensus_reached").get<bool>();
            r.vote_count = j.at("vote_count").get<std::size_t>();
            r.approval_percentage = j.value("approval_percentage", 0.0);
            r.participating_agents = j.value("participating_agents", std::vector<std::string>{});
            r.non_participating_agents = j.value("non_participating_agents", std::vector<std::string>{});
            for (const auto &vj : j.value("votes", Json::array()))
            {
                auto vote = Vote::from_json(vj);
                if (!vote)
                    return std::unexpected(vote.error());
                r.votes.push_back(std::move(*vote));
            }
            r.execution_status = unwrap_enum(execution_status_from_string(j.value("execution_status", "pending")));
            r.execution_details = j.value("execution_details", Json::object());
            r.created_at = unwrap_time(j, "created_at");
            r.completed_at = unwrap_time(j, "completed_at");
            r.metadata = j.value("metadata", Json::object());
            return r;
        }
        catch (const std::exception &e)
        {
            return std::unexpected(ConcordError::parsing(std::string("Invalid decision result JSON: ") + e.what()));
        }
    }

    // ========== LiveStatus ==========

    LiveStatus LiveStatus::from_votes(const Decision &decision, const std::vector<Vote> &votes, TimePoint now)
    {
        LiveStatus status;
        status.decision = decision;
        status.total_votes = votes.size();

        for (auto type : kAllVoteTypes)
        {
            status.vote_counts[type] = 0;
            status.weighted_votes[type] = 0.0;
        }
        for (const auto &v : votes)
        {
            status.vote_counts[v.vote_type] += 1;
            status.weighted_votes[v.vote_type] += v.weight;
            status.voting_agents.push_back(v.agent_id);
        }

        auto eligible = decision.eligible_agents();
        status.participation_rate = eligible.empty()
                                        ? 0.0
                                        : static_cast<double>(votes.size()) / static_cast<double>(eligible.size());
        for (const auto &agent : eligible)
        {
            if (!contains(status.voting_agents, agent))
                status.non_voting_agents.push_back(agent);
        }

        auto remaining = std::chrono::duration<double>(decision.expires_at - now).count();
        status.time_remaining_seconds = std::max(0.0, remaining);
        return status;
    }

    Json LiveStatus::to_json() const
    {
        Json counts = Json::object();
        for (const auto &[type, n] : vote_counts)
            counts[to_string(type)] = n;
        Json weighted = Json::object();
        for (const auto &[type, w] : weighted_votes)
            weighted[to_string(type)] = w;

        return Json{
            {"decision_id", decision.decision_id},
            {"title", decision.title},
            {"status", to_string(decision.status)},
            {"decision_type", decision.decision_type},
            {"priority", to_string(decision.priority)},
            {"consensus_algorithm", to_string(decision.consensus_algorithm)},
            {"total_votes", total_votes},
            {"required_votes", decision.minimum_votes},
            {"vote_counts", counts},
            {"weighted_votes", weighted},
            {"participation_rate", participation_rate},
            {"voting_agents", voting_agents},
            {"non_voting_agents", non_voting_agents},
            {"time_remaining", time_remaining_seconds},
            {"created_at", to_iso8601(decision.created_at)},
            {"expires_at", to_iso8601(decision.expires_at)},
            {"options", decision.options},
            {"metadata", decision.metadata}};
    }

    Json status_to_json(const DecisionStatusView &view)
    {
        if (const auto *live = std::get_if<LiveStatus>(&view))
            return live->to_json();

        const auto &result = std::get<DecisionResult>(view);
        return Json{
            {"decision_id", result.decision_id},
            {"status", "completed"},
            {"result", result.to_json()}};
    }

} // namespace concord
