#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace concord
{
    namespace event_types
    {
        inline constexpr const char *kDecisionCreated = "decision_created";
        inline constexpr const char *kVoteCast = "vote_cast";
        inline constexpr const char *kDecisionCompleted = "decision_completed";
    } // namespace event_types

    struct DecisionEvent
    {
        std::string event_type;
        std::string decision_id;
        std::string ts;
        nlohmann::json details;

        static DecisionEvent make(std::string event_type,
                                  std::string decision_id,
                                  TimePoint at,
                                  nlohmann::json details);

        nlohmann::json to_json() const;
    };

    /**
     * Event bus boundary. Delivery is best-effort; a failed emit is logged by
     * the caller and never affects decision state.
     */
    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        virtual Result<void> emit(const DecisionEvent &event) = 0;
    };

    /**
     * EventChain links events with hashes for tamper detection. Each link is
     * SHA-256 over the previous hash and the event's JSON.
     */
    class EventChain
    {
    public:
        EventChain();

        /** Append an event, returning its chain hash */
        std::string append(const DecisionEvent &event);

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        std::vector<std::string> hashes() const;

    private:
        mutable std::mutex mutex_;
        std::vector<std::string> hashes_;
    };

    /** Default sink: chains every event and writes it as one JSON line through spdlog. */
    class LoggingEventSink : public EventSink
    {
    public:
        LoggingEventSink();

        Result<void> emit(const DecisionEvent &event) override;

        const EventChain &chain() const { return chain_; }

    private:
        EventChain chain_;
    };

} // namespace concord
