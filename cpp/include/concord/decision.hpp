#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace concord
{

    /**
     * One agent's input to one decision.
     * weight is the agent's voting weight snapshotted when the vote was cast;
     * later reputation changes never touch it.
     */
    struct Vote
    {
        std::string vote_id;
        std::string decision_id;
        std::string agent_id;
        VoteType vote_type{VoteType::Abstain};
        double confidence{0.0}; // advisory, not used in quorum math
        std::string reasoning;
        nlohmann::json metadata = nlohmann::json::object();
        TimePoint timestamp{};
        double weight{1.0};

        nlohmann::json to_json() const;
        static Result<Vote> from_json(const nlohmann::json &j);
    };

    /**
     * Caller-supplied parameters of a new decision.
     * options and metadata are opaque to the engine; they are stored and
     * forwarded unchanged.
     */
    struct DecisionRequest
    {
        std::string decision_type;
        std::string title;
        std::string description;
        nlohmann::json options = nlohmann::json::array();
        std::vector<std::string> required_agents;
        std::vector<std::string> optional_agents;
        ConsensusAlgorithm consensus_algorithm{ConsensusAlgorithm::SimpleMajority};
        double consensus_threshold{0.5};
        std::optional<std::int64_t> timeout_seconds; // defaulted from priority when absent
        Priority priority{Priority::Medium};
        std::string created_by;
        nlohmann::json metadata = nlohmann::json::object();

        static Result<DecisionRequest> from_json(const nlohmann::json &j);
    };

    /**
     * A unit of collective choice.
     * expires_at is fixed at creation.
     */
    struct Decision
    {
        std::string decision_id;
        std::string decision_type;
        std::string title;
        std::string description;
        nlohmann::json options = nlohmann::json::array();
        std::vector<std::string> required_agents;
        std::vector<std::string> optional_agents;
        ConsensusAlgorithm consensus_algorithm{ConsensusAlgorithm::SimpleMajority};
        double consensus_threshold{0.5};
        std::size_t minimum_votes{1};
        std::int64_t timeout_seconds{300};
        std::string created_by;
        TimePoint created_at{};
        TimePoint expires_at{};
        nlohmann::json metadata = nlohmann::json::object();
        DecisionStatus status{DecisionStatus::Pending};
        Priority priority{Priority::Medium};

        bool is_required(std::string_view agent_id) const;
        bool is_eligible(std::string_view agent_id) const;

        /** Required agents followed by optional agents */
        std::vector<std::string> eligible_agents() const;

        nlohmann::json to_json() const;
        static Result<Decision> from_json(const nlohmann::json &j);
    };

    /**
     * Immutable outcome of a decision, produced exactly once.
     */
    struct DecisionResult
    {
        std::string decision_id;
        Outcome final_decision{Outcome::Timeout};
        bool consensus_reached{false};
        std::size_t vote_count{0};
        double approval_percentage{0.0};
        std::vector<std::string> participating_agents;
        std::vector<std::string> non_participating_agents;
        std::vector<Vote> votes;
        ExecutionStatus execution_status{ExecutionStatus::Pending};
        nlohmann::json execution_details = nlohmann::json::object();
        TimePoint created_at{};
        TimePoint completed_at{};
        nlohmann::json metadata = nlohmann::json::object();

        /** Build the result for decision from its final vote set */
        static DecisionResult from_votes(const Decision &decision,
                                         const std::vector<Vote> &votes,
                                         Outcome final_decision,
                                         bool consensus_reached,
                                         TimePoint completed_at);

        nlohmann::json to_json() const;
        static Result<DecisionResult> from_json(const nlohmann::json &j);
    };

    /**
     * Live view of a decision that is still collecting votes.
     */
    struct LiveStatus
    {
        Decision decision;
        std::size_t total_votes{0};
        std::map<VoteType, std::size_t> vote_counts;
        std::map<VoteType, double> weighted_votes;
        double participation_rate{0.0};
        std::vector<std::string> voting_agents;
        std::vector<std::string> non_voting_agents;
        double time_remaining_seconds{0.0};

        static LiveStatus from_votes(const Decision &decision, const std::vector<Vote> &votes, TimePoint now);

        nlohmann::json to_json() const;
    };

    /** Status of a decision: live while voting, the stored result once resolved */
    using DecisionStatusView = std::variant<LiveStatus, DecisionResult>;

    nlohmann::json status_to_json(const DecisionStatusView &view);

} // namespace concord
