#include "concord/config.hpp"
#include <toml++/toml.h>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <utility>

namespace concord
{
    namespace
    {
        Result<std::uint16_t> to_port(std::string_view source, std::int64_t value)
        {
            if (value < 0 || value > std::numeric_limits<std::uint16_t>::max())
                return std::unexpected(ConcordError::config(std::format("{} out of range: {}", source, value)));
            return static_cast<std::uint16_t>(value);
        }

        bool within_unit(double v) { return v >= 0.0 && v <= 1.0; } // false for NaN

        Result<EngineConfig> parse_toml(const toml::table &tbl, EngineConfig cfg)
        {
            if (auto engine = tbl["engine"].as_table())
            {
                if (auto v = (*engine)["default_timeout_seconds"].value<int64_t>())
                    cfg.engine.default_timeout_seconds = *v;
                if (auto v = (*engine)["high_timeout_seconds"].value<int64_t>())
                    cfg.engine.high_timeout_seconds = *v;
                if (auto v = (*engine)["critical_timeout_seconds"].value<int64_t>())
                    cfg.engine.critical_timeout_seconds = *v;
                if (auto v = (*engine)["sweep_interval_seconds"].value<int64_t>())
                    cfg.engine.sweep_interval_seconds = *v;
            }

            if (auto rep = tbl["reputation"].as_table())
            {
                if (auto v = (*rep)["decay_factor"].value<double>())
                    cfg.reputation.decay_factor = *v;
                if (auto v = (*rep)["decay_interval_seconds"].value<int64_t>())
                    cfg.reputation.decay_interval_seconds = *v;
                if (auto v = (*rep)["participation_reward"].value<double>())
                    cfg.reputation.rules.participation_reward = *v;
                if (auto v = (*rep)["participation_penalty"].value<double>())
                    cfg.reputation.rules.participation_penalty = *v;
                if (auto v = (*rep)["correct_vote_reward"].value<double>())
                    cfg.reputation.rules.correct_vote_reward = *v;
                if (auto v = (*rep)["incorrect_vote_penalty"].value<double>())
                    cfg.reputation.rules.incorrect_vote_penalty = *v;

                if (auto seeds = (*rep)["seed"].as_array())
                {
                    for (const auto &node : *seeds)
                    {
                        const auto *entry = node.as_table();
                        if (!entry)
                            continue;
                        auto agent = (*entry)["agent_id"].value<std::string>();
                        if (!agent)
                            continue;
                        ReputationSeed seed{*agent, (*entry)["reputation"].value_or(1.0)};
                        cfg.reputation.seed.push_back(std::move(seed));
                    }
                }
            }

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto v = (*storage)["enabled"].value<bool>())
                    cfg.storage.enabled = *v;
                if (auto v = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *v;
            }

            if (auto server = tbl["server"].as_table())
            {
                if (auto v = (*server)["port"].value<int64_t>())
                {
                    auto port = to_port("server.port", *v);
                    if (!port)
                        return std::unexpected(port.error());
                    cfg.server.port = *port;
                }
                if (auto v = (*server)["threads"].value<int64_t>())
                {
                    if (*v <= 0)
                        return std::unexpected(ConcordError::config("server.threads must be positive"));
                    cfg.server.threads = static_cast<std::size_t>(*v);
                }
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto v = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *v;
            }

            return cfg;
        }

        Result<std::int64_t> env_int(const char *name, const char *value)
        {
            try
            {
                return static_cast<std::int64_t>(std::stoll(value));
            }
            catch (const std::exception &)
            {
                return std::unexpected(ConcordError::config(std::format("{} is not an integer: {}", name, value)));
            }
        }

        Result<double> env_double(const char *name, const char *value)
        {
            try
            {
                return std::stod(value);
            }
            catch (const std::exception &)
            {
                return std::unexpected(ConcordError::config(std::format("{} is not a number: {}", name, value)));
            }
        }
    } // namespace

    std::int64_t EngineSettings::timeout_for(Priority priority) const
    {
        switch (priority)
        {
        case Priority::Critical:
            return critical_timeout_seconds;
        case Priority::High:
            return high_timeout_seconds;
        case Priority::Medium:
        case Priority::Low:
            return default_timeout_seconds;
        }
        return default_timeout_seconds;
    }

    Result<EngineConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(ConcordError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<EngineConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        EngineConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(ConcordError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(EngineConfig &cfg)
    {
        if (const char *path = std::getenv("CONCORD_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
        if (const char *enabled = std::getenv("CONCORD_STORAGE_ENABLED"))
            cfg.storage.enabled = std::string(enabled) != "0";
        if (const char *level = std::getenv("CONCORD_LOG_LEVEL"))
            cfg.logging.level = level;

        if (const char *port = std::getenv("CONCORD_SERVER_PORT"))
        {
            auto v = env_int("CONCORD_SERVER_PORT", port);
            if (!v)
                return std::unexpected(v.error());
            auto checked = to_port("CONCORD_SERVER_PORT", *v);
            if (!checked)
                return std::unexpected(checked.error());
            cfg.server.port = *checked;
        }
        if (const char *sweep = std::getenv("CONCORD_SWEEP_INTERVAL"))
        {
            auto v = env_int("CONCORD_SWEEP_INTERVAL", sweep);
            if (!v)
                return std::unexpected(v.error());
            cfg.engine.sweep_interval_seconds = *v;
        }
        if (const char *decay = std::getenv("CONCORD_DECAY_FACTOR"))
        {
            auto v = env_double("CONCORD_DECAY_FACTOR", decay);
            if (!v)
                return std::unexpected(v.error());
            cfg.reputation.decay_factor = *v;
        }
        return {};
    }

    Result<void> ConfigLoader::validate(const EngineConfig &cfg)
    {
        const auto &e = cfg.engine;
        if (e.default_timeout_seconds <= 0 || e.high_timeout_seconds <= 0 || e.critical_timeout_seconds <= 0)
            return std::unexpected(ConcordError::config("engine timeouts must be positive"));
        if (e.sweep_interval_seconds <= 0)
            return std::unexpected(ConcordError::config("engine.sweep_interval_seconds must be positive"));

        const auto &r = cfg.reputation;
        if (!within_unit(r.decay_factor))
            return std::unexpected(ConcordError::config(std::format("reputation.decay_factor out of range: {}", r.decay_factor)));
        if (r.decay_interval_seconds <= 0)
            return std::unexpected(ConcordError::config("reputation.decay_interval_seconds must be positive"));
        for (const auto &[name, delta] : {std::pair{"participation_reward", r.rules.participation_reward},
                                          std::pair{"participation_penalty", r.rules.participation_penalty},
                                          std::pair{"correct_vote_reward", r.rules.correct_vote_reward},
                                          std::pair{"incorrect_vote_penalty", r.rules.incorrect_vote_penalty}})
        {
            if (!within_unit(delta))
                return std::unexpected(ConcordError::config(std::format("reputation.{} out of range: {}", name, delta)));
        }
        for (const auto &seed : r.seed)
        {
            if (seed.agent_id.empty())
                return std::unexpected(ConcordError::config("reputation.seed entry without agent_id"));
            if (!within_unit(seed.reputation))
                return std::unexpected(ConcordError::config(
                    std::format("reputation.seed for {} out of range: {}", seed.agent_id, seed.reputation)));
        }

        if (cfg.server.threads == 0)
            return std::unexpected(ConcordError::config("server.threads must be positive"));
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const EngineConfig &cfg)
    {
        nlohmann::json seeds = nlohmann::json::array();
        for (const auto &s : cfg.reputation.seed)
            seeds.push_back({{"agent_id", s.agent_id}, {"reputation", s.reputation}});

        nlohmann::json j;
        j["engine"] = {
            {"default_timeout_seconds", cfg.engine.default_timeout_seconds},
            {"high_timeout_seconds", cfg.engine.high_timeout_seconds},
            {"critical_timeout_seconds", cfg.engine.critical_timeout_seconds},
            {"sweep_interval_seconds", cfg.engine.sweep_interval_seconds}};
        j["reputation"] = {
            {"decay_factor", cfg.reputation.decay_factor},
            {"decay_interval_seconds", cfg.reputation.decay_interval_seconds},
            {"participation_reward", cfg.reputation.rules.participation_reward},
            {"participation_penalty", cfg.reputation.rules.participation_penalty},
            {"correct_vote_reward", cfg.reputation.rules.correct_vote_reward},
            {"incorrect_vote_penalty", cfg.reputation.rules.incorrect_vote_penalty},
            {"seed", seeds}};
        j["storage"] = {{"enabled", cfg.storage.enabled}, {"rocksdb_path", cfg.storage.rocksdb_path}};
        j["server"] = {{"port", cfg.server.port}, {"threads", cfg.server.threads}};
        j["logging"] = {{"level", cfg.logging.level}};
        return j;
    }

} // namespace concord
