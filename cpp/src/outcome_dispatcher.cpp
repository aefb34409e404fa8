#include "concord/outcome_dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace concord
{

    OutcomeDispatcher::OutcomeDispatcher(std::shared_ptr<ActionExecutor> executor, NowFn now)
        : executor_(std::move(executor)), now_(std::move(now))
    {
    }

    bool OutcomeDispatcher::should_execute(const DecisionResult &result)
    {
        return result.consensus_reached && result.final_decision == Outcome::Approved;
    }

    void OutcomeDispatcher::dispatch(const Decision &decision, DecisionResult &result) const
    {
        if (!should_execute(result))
            return;

        if (!executor_)
        {
            // Nothing wired to act on the decision; acknowledge it.
            result.execution_status = ExecutionStatus::Completed;
            result.execution_details = {
                {"status", "executed"},
                {"action", decision.decision_type},
                {"message", std::format("Decision {} executed successfully", decision.decision_id)},
                {"timestamp", to_iso8601(now_())}};
            return;
        }

        auto details = executor_->execute(decision.decision_id, decision.decision_type, decision.metadata);
        if (!details)
        {
            spdlog::error("execution of decision {} ({}) failed: {}",
                          decision.decision_id, decision.decision_type, details.error().what());
            result.execution_status = ExecutionStatus::Failed;
            result.execution_details = {
                {"error", details.error().what()},
                {"error_code", to_string(details.error().code)}};
            return;
        }

        result.execution_status = ExecutionStatus::Completed;
        result.execution_details = details->is_object() ? *details : nlohmann::json{{"result", *details}};
    }

} // namespace concord
