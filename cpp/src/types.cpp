#include "concord/types.hpp"

namespace concord
{

    std::string to_string(VoteType type)
    {
        switch (type)
        {
        case VoteType::Approve:
            return "approve";
        case VoteType::Reject:
            return "reject";
        case VoteType::Abstain:
            return "abstain";
        case VoteType::Conditional:
            return "conditional";
        }
        return "unknown";
    }

    std::string to_string(DecisionStatus status)
    {
        switch (status)
        {
        case DecisionStatus::Pending:
            return "pending";
        case DecisionStatus::Voting:
            return "voting";
        case DecisionStatus::ConsensusReached:
            return "consensus_reached";
        case DecisionStatus::Rejected:
            return "rejected";
        case DecisionStatus::Timeout:
            return "timeout";
        case DecisionStatus::Executed:
            return "executed";
        case DecisionStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::string to_string(ConsensusAlgorithm algorithm)
    {
        switch (algorithm)
        {
        case ConsensusAlgorithm::SimpleMajority:
            return "simple_majority";
        case ConsensusAlgorithm::Supermajority:
            return "supermajority";
        case ConsensusAlgorithm::Unanimous:
            return "unanimous";
        case ConsensusAlgorithm::WeightedMajority:
            return "weighted_majority";
        case ConsensusAlgorithm::ByzantineFaultTolerant:
            return "byzantine_fault_tolerant";
        }
        return "unknown";
    }

    std::string to_string(Priority priority)
    {
        switch (priority)
        {
        case Priority::Low:
            return "low";
        case Priority::Medium:
            return "medium";
        case Priority::High:
            return "high";
        case Priority::Critical:
            return "critical";
        }
        return "unknown";
    }

    std::string to_string(ExecutionStatus status)
    {
        switch (status)
        {
        case ExecutionStatus::Pending:
            return "pending";
        case ExecutionStatus::Completed:
            return "completed";
        case ExecutionStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::string to_string(Outcome outcome)
    {
        switch (outcome)
        {
        case Outcome::Approved:
            return "approved";
        case Outcome::Rejected:
            return "rejected";
        case Outcome::Timeout:
            return "timeout";
        }
        return "unknown";
    }

    std::string to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::InvalidState:
            return "invalid_state";
        case ErrorCode::Expired:
            return "expired";
        case ErrorCode::IneligibleAgent:
            return "ineligible_agent";
        case ErrorCode::DuplicateVote:
            return "duplicate_vote";
        case ErrorCode::InvalidDecision:
            return "invalid_decision";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::StorageError:
            return "storage_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        case ErrorCode::ParsingError:
            return "parsing_error";
        case ErrorCode::InternalError:
            return "internal_error";
        }
        return "unknown";
    }

    std::expected<VoteType, std::string> vote_type_from_string(std::string_view s)
    {
        if (s == "approve")
            return VoteType::Approve;
        if (s == "reject")
            return VoteType::Reject;
        if (s == "abstain")
            return VoteType::Abstain;
        if (s == "conditional")
            return VoteType::Conditional;
        return std::unexpected(std::format("Invalid vote type: {}", s));
    }

    std::expected<DecisionStatus, std::string> decision_status_from_string(std::string_view s)
    {
        if (s == "pending")
            return DecisionStatus::Pending;
        if (s == "voting")
            return DecisionStatus::Voting;
        if (s == "consensus_reached")
            return DecisionStatus::ConsensusReached;
        if (s == "rejected")
            return DecisionStatus::Rejected;
        if (s == "timeout")
            return DecisionStatus::Timeout;
        if (s == "executed")
            return DecisionStatus::Executed;
        if (s == "failed")
            return DecisionStatus::Failed;
        return std::unexpected(std::format("Invalid decision status: {}", s));
    }

    std::expected<ConsensusAlgorithm, std::string> algorithm_from_string(std::string_view s)
    {
        if (s == "simple_majority")
            return ConsensusAlgorithm::SimpleMajority;
        if (s == "supermajority")
            return ConsensusAlgorithm::Supermajority;
        if (s == "unanimous")
            return ConsensusAlgorithm::Unanimous;
        if (s == "weighted_majority")
            return ConsensusAlgorithm::WeightedMajority;
        if (s == "byzantine_fault_tolerant")
            return ConsensusAlgorithm::ByzantineFaultTolerant;
        return std::unexpected(std::format("Invalid consensus algorithm: {}", s));
    }

    std::expected<Priority, std::string> priority_from_string(std::string_view s)
    {
        if (s == "low")
            return Priority::Low;
        if (s == "medium")
            return Priority::Medium;
        if (s == "high")
            return Priority::High;
        if (s == "critical")
            return Priority::Critical;
        return std::unexpected(std::format("Invalid priority: {}", s));
    }

    std::expected<ExecutionStatus, std::string> execution_status_from_string(std::string_view s)
    {
        if (s == "pending")
            return ExecutionStatus::Pending;
        if (s == "completed")
            return ExecutionStatus::Completed;
        if (s == "failed")
            return ExecutionStatus::Failed;
        return std::unexpected(std::format("Invalid execution status: {}", s));
    }

    std::expected<Outcome, std::string> outcome_from_string(std::string_view s)
    {
        if (s == "approved")
            return Outcome::Approved;
        if (s == "rejected")
            return Outcome::Rejected;
        if (s == "timeout")
            return Outcome::Timeout;
        return std::unexpected(std::format("Invalid outcome: {}", s));
    }

    bool is_terminal(DecisionStatus status)
    {
        return status == DecisionStatus::ConsensusReached ||
               status == DecisionStatus::Rejected ||
               status == DecisionStatus::Timeout;
    }

} // namespace concord
