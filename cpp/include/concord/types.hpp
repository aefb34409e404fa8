#pragma once

#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace concord
{

    /**
     * Direction of a single agent's vote.
     * Only Approve and Reject are tallied; Abstain and Conditional count
     * toward participation and quorum size.
     */
    enum class VoteType
    {
        Approve,
        Reject,
        Abstain,
        Conditional
    };

    /**
     * Lifecycle state of a decision.
     * ConsensusReached, Rejected and Timeout are terminal.
     */
    enum class DecisionStatus
    {
        Pending,
        Voting,
        ConsensusReached,
        Rejected,
        Timeout,
        Executed,
        Failed
    };

    enum class ConsensusAlgorithm
    {
        SimpleMajority,
        Supermajority,
        Unanimous,
        WeightedMajority,
        ByzantineFaultTolerant
    };

    enum class Priority
    {
        Low,
        Medium,
        High,
        Critical
    };

    enum class ExecutionStatus
    {
        Pending,
        Completed,
        Failed
    };

    /** Final outcome recorded in a decision result */
    enum class Outcome
    {
        Approved,
        Rejected,
        Timeout
    };

    std::string to_string(VoteType type);
    std::string to_string(DecisionStatus status);
    std::string to_string(ConsensusAlgorithm algorithm);
    std::string to_string(Priority priority);
    std::string to_string(ExecutionStatus status);
    std::string to_string(Outcome outcome);

    std::expected<VoteType, std::string> vote_type_from_string(std::string_view s);
    std::expected<DecisionStatus, std::string> decision_status_from_string(std::string_view s);
    std::expected<ConsensusAlgorithm, std::string> algorithm_from_string(std::string_view s);
    std::expected<Priority, std::string> priority_from_string(std::string_view s);
    std::expected<ExecutionStatus, std::string> execution_status_from_string(std::string_view s);
    std::expected<Outcome, std::string> outcome_from_string(std::string_view s);

    /** True for states from which no further transition occurs */
    bool is_terminal(DecisionStatus status);

    /**
     * Error kinds reported by engine operations.
     * The first six are the caller-facing taxonomy; the rest cover the
     * surrounding runtime (config, storage, hashing, parsing).
     */
    enum class ErrorCode
    {
        NotFound,
        InvalidState,
        Expired,
        IneligibleAgent,
        DuplicateVote,
        InvalidDecision,
        InvalidInput,
        ConfigError,
        StorageError,
        CryptoError,
        ParsingError,
        InternalError
    };

    std::string to_string(ErrorCode code);

    /**
     * Concord error with code and message
     */
    class ConcordError : public std::runtime_error
    {
    public:
        ErrorCode code;

        ConcordError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static ConcordError not_found(const std::string &msg)
        {
            return ConcordError(ErrorCode::NotFound, msg);
        }

        static ConcordError invalid_state(const std::string &msg)
        {
            return ConcordError(ErrorCode::InvalidState, msg);
        }

        static ConcordError expired(const std::string &msg)
        {
            return ConcordError(ErrorCode::Expired, msg);
        }

        static ConcordError ineligible_agent(const std::string &msg)
        {
            return ConcordError(ErrorCode::IneligibleAgent, msg);
        }

        static ConcordError duplicate_vote(const std::string &msg)
        {
            return ConcordError(ErrorCode::DuplicateVote, msg);
        }

        static ConcordError invalid_decision(const std::string &msg)
        {
            return ConcordError(ErrorCode::InvalidDecision, msg);
        }

        static ConcordError invalid_input(const std::string &msg)
        {
            return ConcordError(ErrorCode::InvalidInput, msg);
        }

        static ConcordError config(const std::string &msg)
        {
            return ConcordError(ErrorCode::ConfigError, msg);
        }

        static ConcordError storage(const std::string &msg)
        {
            return ConcordError(ErrorCode::StorageError, msg);
        }

        static ConcordError crypto(const std::string &msg)
        {
            return ConcordError(ErrorCode::CryptoError, msg);
        }

        static ConcordError parsing(const std::string &msg)
        {
            return ConcordError(ErrorCode::ParsingError, msg);
        }

        static ConcordError internal(const std::string &msg)
        {
            return ConcordError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, ConcordError>;

} // namespace concord
