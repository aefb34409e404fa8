#pragma once

#include "decision.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace concord
{

    struct Evaluation
    {
        bool resolved{false};
        std::optional<Outcome> outcome; // Approved or Rejected when resolved

        static Evaluation unresolved() { return {}; }
        static Evaluation decided(Outcome o) { return Evaluation{true, o}; }
    };

    /**
     * Quorum and outcome rules. Pure functions over a vote set.
     *
     * Only Approve and Reject are tallied. When neither side satisfies its
     * condition (e.g. an exact tie) the result is unresolved, not rejected.
     */
    class ConsensusEvaluator
    {
    public:
        static constexpr double kSupermajorityThreshold = 0.67;
        static constexpr double kByzantineThreshold = 2.0 / 3.0;

        /** Minimum votes before any algorithm runs, derived from the required-agent count */
        static std::size_t minimum_votes(ConsensusAlgorithm algorithm, std::size_t required_agents);

        /** Evaluate votes under decision's algorithm; unresolved below minimum_votes */
        static Evaluation evaluate(const std::vector<Vote> &votes, const Decision &decision);

        static Evaluation simple_majority(const std::vector<Vote> &votes);
        static Evaluation supermajority(const std::vector<Vote> &votes, double threshold);
        static Evaluation unanimous(const std::vector<Vote> &votes);
        static Evaluation weighted_majority(const std::vector<Vote> &votes);
        static Evaluation byzantine_fault_tolerant(const std::vector<Vote> &votes);
    };

} // namespace concord
