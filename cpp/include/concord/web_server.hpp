#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace concord
{
    class ConsensusEngine;

    struct WebServerConfig
    {
        std::uint16_t port{8080};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        bool handle_signals{true}; // stop on SIGINT/SIGTERM
    };

    struct ApiResponse
    {
        unsigned status{200};
        nlohmann::json body;

        /** Compact JSON text; invalid UTF-8 is replaced with U+FFFD instead of throwing. */
        std::string serialize() const;
    };

    /** HTTP status for an engine error code */
    unsigned http_status_for(ErrorCode code);

    /**
     * Route one request against the engine. Socket-free so routing can be
     * exercised directly; the server is a thin Beast wrapper around it.
     *
     * POST /decisions, POST /decisions/{id}/votes, GET /decisions/{id},
     * GET /metrics, GET /health
     */
    ApiResponse handle_api_request(ConsensusEngine &engine,
                                   std::string_view method,
                                   std::string_view target,
                                   const std::string &body);

    /**
     * Boost.Beast HTTP server exposing the engine's JSON API.
     */
    class WebServer
    {
    public:
        WebServer(std::shared_ptr<ConsensusEngine> engine, const WebServerConfig &cfg = WebServerConfig{});
        ~WebServer();

        /** Start the server and block until stopped. */
        void run();

        /** Request a stop; active connections complete gracefully. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
