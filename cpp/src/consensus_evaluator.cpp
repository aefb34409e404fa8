#include "concord/consensus_evaluator.hpp"
#include <algorithm>

namespace concord
{

    namespace
    {
        struct Tally
        {
            std::size_t approve{0};
            std::size_t reject{0};
            double approve_weight{0.0};
            double reject_weight{0.0};
            double total_weight{0.0};
        };

        Tally tally(const std::vector<Vote> &votes)
        {
            Tally t;
            for (const auto &v : votes)
            {
                t.total_weight += v.weight;
                if (v.vote_type == VoteType::Approve)
                {
                    ++t.approve;
                    t.approve_weight += v.weight;
                }
                else if (v.vote_type == VoteType::Reject)
                {
                    ++t.reject;
                    t.reject_weight += v.weight;
                }
            }
            return t;
        }
    } // namespace

    std::size_t ConsensusEvaluator::minimum_votes(ConsensusAlgorithm algorithm, std::size_t required_agents)
    {
        // Integer ceilings of n * 0.67 and n * 0.5, avoiding binary rounding of the product.
        switch (algorithm)
        {
        case ConsensusAlgorithm::Unanimous:
            return required_agents;
        case ConsensusAlgorithm::Supermajority:
        case ConsensusAlgorithm::ByzantineFaultTolerant:
            return std::max<std::size_t>(1, (required_agents * 67 + 99) / 100);
        case ConsensusAlgorithm::SimpleMajority:
        case ConsensusAlgorithm::WeightedMajority:
            return std::max<std::size_t>(1, (required_agents + 1) / 2);
        }
        return std::max<std::size_t>(1, required_agents);
    }

    Evaluation ConsensusEvaluator::evaluate(const std::vector<Vote> &votes, const Decision &decision)
    {
        if (votes.size() < decision.minimum_votes)
            return Evaluation::unresolved();

        switch (decision.consensus_algorithm)
        {
        case ConsensusAlgorithm::SimpleMajority:
            return simple_majority(votes);
        case ConsensusAlgorithm::Supermajority:
            return supermajority(votes, kSupermajorityThreshold);
        case ConsensusAlgorithm::Unanimous:
            return unanimous(votes);
        case ConsensusAlgorithm::WeightedMajority:
            return weighted_majority(votes);
        case ConsensusAlgorithm::ByzantineFaultTolerant:
            return byzantine_fault_tolerant(votes);
        }
        return Evaluation::unresolved();
    }

    Evaluation ConsensusEvaluator::simple_majority(const std::vector<Vote> &votes)
    {
        if (votes.empty())
            return Evaluation::unresolved();

        auto t = tally(votes);
        double half = static_cast<double>(votes.size()) / 2.0;

        if (t.approve > t.reject && static_cast<double>(t.approve) > half)
            return Evaluation::decided(Outcome::Approved);
        if (t.reject > t.approve && static_cast<double>(t.reject) > half)
            return Evaluation::decided(Outcome::Rejected);
        return Evaluation::unresolved();
    }

    Evaluation ConsensusEvaluator::supermajority(const std::vector<Vote> &votes, double threshold)
    {
        if (votes.empty())
            return Evaluation::unresolved();

        auto t = tally(votes);
        double needed = static_cast<double>(votes.size()) * threshold;

        if (static_cast<double>(t.approve) >= needed)
            return Evaluation::decided(Outcome::Approved);
        if (static_cast<double>(t.reject) >= needed)
            return Evaluation::decided(Outcome::Rejected);
        return Evaluation::unresolved();
    }

    Evaluation ConsensusEvaluator::unanimous(const std::vector<Vote> &votes)
    {
        if (votes.empty())
            return Evaluation::unresolved();

        auto first = votes.front().vote_type;
        bool all_same = std::all_of(votes.begin(), votes.end(),
                                    [first](const Vote &v) { return v.vote_type == first; });
        if (!all_same)
            return Evaluation::unresolved();

        if (first == VoteType::Approve)
            return Evaluation::decided(Outcome::Approved);
        if (first == VoteType::Reject)
            return Evaluation::decided(Outcome::Rejected);
        return Evaluation::unresolved();
    }

    Evaluation ConsensusEvaluator::weighted_majority(const std::vector<Vote> &votes)
    {
        auto t = tally(votes);
        if (t.total_weight <= 0.0)
            return Evaluation::unresolved();

        double half = t.total_weight / 2.0;
        if (t.approve_weight > t.reject_weight && t.approve_weight > half)
            return Evaluation::decided(Outcome::Approved);
        if (t.reject_weight > t.approve_weight && t.reject_weight > half)
            return Evaluation::decided(Outcome::Rejected);
        return Evaluation::unresolved();
    }

    Evaluation ConsensusEvaluator::byzantine_fault_tolerant(const std::vector<Vote> &votes)
    {
        // Tolerates up to one third faulty voters.
        return supermajority(votes, kByzantineThreshold);
    }

} // namespace concord
