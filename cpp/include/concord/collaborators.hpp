#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace concord
{

    class DecisionStore;
    class EventSink;

    /**
     * Delivers voting requests to agents. Fire-and-forget: the engine never
     * waits for delivery confirmation.
     */
    class Messenger
    {
    public:
        virtual ~Messenger() = default;

        virtual Result<void> send_vote_request(const std::string &decision_id,
                                               const std::string &agent_id,
                                               const nlohmann::json &payload,
                                               bool required,
                                               std::chrono::seconds expires_in) = 0;
    };

    /** Writes vote requests to the log instead of delivering them. Used when no transport is wired. */
    class LoggingMessenger : public Messenger
    {
    public:
        Result<void> send_vote_request(const std::string &decision_id,
                                       const std::string &agent_id,
                                       const nlohmann::json &payload,
                                       bool required,
                                       std::chrono::seconds expires_in) override;

        std::size_t sent() const { return sent_; }

    private:
        std::atomic<std::size_t> sent_{0};
    };

    /**
     * Carries out an approved decision. Implementations should treat
     * decision_id as an idempotency key.
     */
    class ActionExecutor
    {
    public:
        virtual ~ActionExecutor() = default;

        /** Returns execution details on success */
        virtual Result<nlohmann::json> execute(const std::string &decision_id,
                                               const std::string &decision_type,
                                               const nlohmann::json &metadata) = 0;
    };

    /**
     * External boundaries the engine is wired to. Every pointer is optional;
     * a missing collaborator turns the matching side effect into a no-op.
     */
    struct Collaborators
    {
        std::shared_ptr<DecisionStore> store;
        std::shared_ptr<Messenger> messenger;
        std::shared_ptr<ActionExecutor> executor;
        std::shared_ptr<EventSink> events;
        NowFn now{system_now};
    };

} // namespace concord
