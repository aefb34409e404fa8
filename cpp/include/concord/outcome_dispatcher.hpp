#pragma once

#include "collaborators.hpp"
#include "decision.hpp"
#include <memory>

namespace concord
{

    /**
     * Hands approved decisions to the action-execution collaborator and
     * records what happened in the result. An execution failure is recorded
     * as ExecutionStatus::Failed; the consensus outcome is never reversed.
     */
    class OutcomeDispatcher
    {
    public:
        OutcomeDispatcher(std::shared_ptr<ActionExecutor> executor, NowFn now);

        /** True when result requires execution (consensus reached and approved) */
        static bool should_execute(const DecisionResult &result);

        void dispatch(const Decision &decision, DecisionResult &result) const;

    private:
        std::shared_ptr<ActionExecutor> executor_;
        NowFn now_;
    };

} // namespace concord
