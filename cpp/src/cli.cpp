#include "concord/cli.hpp"
#include "concord/config.hpp"
#include "concord/decision_store.hpp"
#include "concord/engine.hpp"
#include "concord/events.hpp"
#include "concord/web_server.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

namespace concord::cli
{
	namespace
	{
		void apply_log_level(const LoggingConfig &cfg)
		{
			spdlog::set_level(spdlog::level::from_str(cfg.level));
		}

		int serve(const std::string &config_path, std::optional<std::uint16_t> port, std::optional<std::size_t> threads)
		{
			auto cfg = config_path.empty() ? ConfigLoader::from_string("") : ConfigLoader::load(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			apply_log_level(cfg->logging);

			Collaborators collaborators;
			collaborators.messenger = std::make_shared<LoggingMessenger>();
			collaborators.events = std::make_shared<LoggingEventSink>();
			if (cfg->storage.enabled)
			{
				try
				{
					collaborators.store = std::make_shared<RocksDbDecisionStore>(cfg->storage);
				}
				catch (const std::exception &e)
				{
					spdlog::error("storage unavailable: {}", e.what());
					return 1;
				}
			}

			auto engine = std::make_shared<ConsensusEngine>(*cfg, collaborators);
			if (auto init = engine->initialize(); !init)
			{
				std::cerr << init.error().what() << std::endl;
				return 1;
			}

			WebServerConfig wsc;
			wsc.port = port.value_or(cfg->server.port);
			wsc.threads = threads.value_or(cfg->server.threads);

			try
			{
				WebServer server(engine, wsc);
				server.run();
			}
			catch (const std::exception &e)
			{
				spdlog::error("server failed: {}", e.what());
				engine->shutdown();
				return 1;
			}

			engine->shutdown();
			return 0;
		}

		int print_results(const std::string &db_path)
		{
			StorageConfig storage;
			storage.enabled = true;
			storage.rocksdb_path = db_path;

			std::unique_ptr<RocksDbDecisionStore> store;
			try
			{
				store = std::make_unique<RocksDbDecisionStore>(storage);
			}
			catch (const std::exception &e)
			{
				std::cerr << e.what() << std::endl;
				return 1;
			}

			auto results = store->list_results();
			if (!results)
			{
				std::cerr << results.error().what() << std::endl;
				return 1;
			}

			nlohmann::json out = nlohmann::json::array();
			for (const auto &r : *results)
				out.push_back(r.to_json());
			std::cout << out.dump(2) << std::endl;
			return 0;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Concord consensus decision engine"};

		std::string config_path;
		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path")->required();

		std::string serve_config;
		std::uint16_t serve_port{0};
		std::size_t serve_threads{0};
		auto serve_cmd = app.add_subcommand("serve", "Run the engine and its HTTP API until interrupted");
		serve_cmd->add_option("--config", serve_config, "Path to config TOML");
		auto port_opt = serve_cmd->add_option("--port", serve_port, "Port to bind (overrides config)");
		auto threads_opt = serve_cmd->add_option("--threads", serve_threads, "Number of worker threads (overrides config)");

		std::string db_path;
		auto results_cmd = app.add_subcommand("results", "Print stored decision results");
		results_cmd->add_option("--db", db_path, "RocksDB path")->required();

		CLI11_PARSE(app, argc, argv);

		if (*cfg_cmd)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*serve_cmd)
		{
			std::optional<std::uint16_t> port;
			std::optional<std::size_t> threads;
			if (port_opt->count() > 0)
				port = serve_port;
			if (threads_opt->count() > 0)
				threads = serve_threads;
			return serve(serve_config, port, threads);
		}

		if (*results_cmd)
			return print_results(db_path);

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace concord::cli
