#include "concord/events.hpp"
#include "concord/crypto.hpp"
#include <spdlog/spdlog.h>

namespace concord
{

    DecisionEvent DecisionEvent::make(std::string event_type,
                                      std::string decision_id,
                                      TimePoint at,
                                      nlohmann::json details)
    {
        return DecisionEvent{
            std::move(event_type),
            std::move(decision_id),
            to_iso8601(at),
            std::move(details)};
    }

    nlohmann::json DecisionEvent::to_json() const
    {
        return nlohmann::json{{"event_type", event_type},
                              {"decision_id", decision_id},
                              {"timestamp", ts},
                              {"details", details}};
    }

    EventChain::EventChain() = default;

    std::string EventChain::append(const DecisionEvent &event)
    {
        std::lock_guard lock(mutex_);
        std::string material = hashes_.empty() ? std::string{} : hashes_.back();
        material += event.to_json().dump();
        auto hash = crypto::SHA256::to_hex(crypto::SHA256::hash(material));
        hashes_.push_back(hash);
        return hash;
    }

    std::optional<std::string> EventChain::head() const
    {
        std::lock_guard lock(mutex_);
        if (hashes_.empty())
            return std::nullopt;
        return hashes_.back();
    }

    std::vector<std::string> EventChain::hashes() const
    {
        std::lock_guard lock(mutex_);
        return hashes_;
    }

    LoggingEventSink::LoggingEventSink() = default;

    Result<void> LoggingEventSink::emit(const DecisionEvent &event)
    {
        nlohmann::json j = event.to_json();
        j["chain_hash"] = chain_.append(event);
        spdlog::info("event {}", j.dump());
        return {};
    }

} // namespace concord
