#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace concord
{

    struct EngineSettings
    {
        std::int64_t default_timeout_seconds{300};
        std::int64_t high_timeout_seconds{180};
        std::int64_t critical_timeout_seconds{60};
        std::int64_t sweep_interval_seconds{30};

        /** Voting window used when a request does not name one */
        std::int64_t timeout_for(Priority priority) const;
    };

    /** Reputation deltas applied when a decision resolves */
    struct ReputationRules
    {
        double participation_reward{0.1};
        double participation_penalty{0.1};
        double correct_vote_reward{0.05};
        double incorrect_vote_penalty{0.02};
    };

    struct ReputationSeed
    {
        std::string agent_id;
        double reputation{1.0};
    };

    struct ReputationConfig
    {
        double decay_factor{0.95};
        std::int64_t decay_interval_seconds{3600};
        ReputationRules rules{};
        std::vector<ReputationSeed> seed;
    };

    struct StorageConfig
    {
        bool enabled{false};
        std::string rocksdb_path{"./data/concord"};
    };

    struct ServerConfig
    {
        std::uint16_t port{8080};
        std::size_t threads{4};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct EngineConfig
    {
        EngineSettings engine{};
        ReputationConfig reputation{};
        StorageConfig storage{};
        ServerConfig server{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides (CONCORD_*).
     * Values are validated after overrides are applied.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<EngineConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<EngineConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const EngineConfig &cfg);

        static Result<void> validate(const EngineConfig &cfg);

    private:
        static Result<void> apply_env_overrides(EngineConfig &cfg);
    };

} // namespace concord
