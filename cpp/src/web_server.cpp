#include "concord/web_server.hpp"
#include "concord/engine.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <chrono>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace concord
{
    namespace
    {
        ApiResponse error_response(const ConcordError &e)
        {
            return {http_status_for(e.code), {{"error", e.what()}, {"code", to_string(e.code)}}};
        }

        ApiResponse bad_request(const std::string &why)
        {
            return error_response(ConcordError::invalid_input(why));
        }

        std::vector<std::string_view> split_path(std::string_view target)
        {
            if (auto q = target.find('?'); q != std::string_view::npos)
                target = target.substr(0, q);

            std::vector<std::string_view> parts;
            while (!target.empty())
            {
                if (target.front() == '/')
                {
                    target.remove_prefix(1);
                    continue;
                }
                auto next = target.find('/');
                parts.push_back(target.substr(0, next));
                if (next == std::string_view::npos)
                    break;
                target.remove_prefix(next);
            }
            return parts;
        }

        Result<nlohmann::json> parse_body(const std::string &body)
        {
            auto j = nlohmann::json::parse(body, nullptr, false);
            if (j.is_discarded() || !j.is_object())
                return std::unexpected(ConcordError::parsing("request body must be a JSON object"));
            return j;
        }

        ApiResponse create_decision(ConsensusEngine &engine, const std::string &body)
        {
            auto j = parse_body(body);
            if (!j)
                return error_response(j.error());
            auto request = DecisionRequest::from_json(*j);
            if (!request)
                return error_response(request.error());
            auto id = engine.create_decision(std::move(*request));
            if (!id)
                return error_response(id.error());
            return {201, {{"decision_id", *id}}};
        }

        ApiResponse cast_vote(ConsensusEngine &engine, const std::string &decision_id, const std::string &body)
        {
            auto j = parse_body(body);
            if (!j)
                return error_response(j.error());

            if (!j->contains("agent_id") || !(*j)["agent_id"].is_string())
                return bad_request("agent_id is required");
            if (!j->contains("vote_type") || !(*j)["vote_type"].is_string())
                return bad_request("vote_type is required");
            if (!j->contains("confidence") || !(*j)["confidence"].is_number())
                return bad_request("confidence is required");

            auto vote_type = vote_type_from_string((*j)["vote_type"].get<std::string>());
            if (!vote_type)
                return bad_request(vote_type.error());

            if (j->contains("reasoning") && !(*j)["reasoning"].is_string())
                return bad_request("reasoning must be a string");
            if (j->contains("metadata") && !(*j)["metadata"].is_object())
                return bad_request("metadata must be a JSON object");

            auto metadata = j->value("metadata", nlohmann::json::object());
            auto accepted = engine.cast_vote(decision_id,
                                             (*j)["agent_id"].get<std::string>(),
                                             *vote_type,
                                             (*j)["confidence"].get<double>(),
                                             j->value("reasoning", std::string{}),
                                             std::move(metadata));
            if (!accepted)
                return error_response(accepted.error());
            return {200, {{"accepted", *accepted}}};
        }
    } // namespace

    std::string ApiResponse::serialize() const
    {
        // Request targets may carry bytes that are not UTF-8 and get echoed
        // back in error messages.
        return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    unsigned http_status_for(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::InvalidState:
        case ErrorCode::DuplicateVote:
            return 409;
        case ErrorCode::Expired:
            return 410;
        case ErrorCode::IneligibleAgent:
            return 403;
        case ErrorCode::InvalidDecision:
        case ErrorCode::InvalidInput:
        case ErrorCode::ParsingError:
            return 400;
        case ErrorCode::ConfigError:
        case ErrorCode::StorageError:
        case ErrorCode::CryptoError:
        case ErrorCode::InternalError:
            return 500;
        }
        return 500;
    }

    ApiResponse handle_api_request(ConsensusEngine &engine,
                                   std::string_view method,
                                   std::string_view target,
                                   const std::string &body)
    {
        auto parts = split_path(target);
        bool get = method == "GET";
        bool post = method == "POST";

        if (parts.size() == 1 && parts[0] == "health")
        {
            if (!get)
                return {405, {{"error", "method not allowed"}}};
            return {200, {{"status", "ok"}, {"initialized", engine.initialized()}}};
        }

        if (parts.size() == 1 && parts[0] == "metrics")
        {
            if (!get)
                return {405, {{"error", "method not allowed"}}};
            return {200, engine.get_metrics().to_json()};
        }

        if (!parts.empty() && parts[0] == "decisions")
        {
            if (parts.size() == 1)
            {
                if (!post)
                    return {405, {{"error", "method not allowed"}}};
                return create_decision(engine, body);
            }

            std::string id(parts[1]);
            if (parts.size() == 2)
            {
                if (!get)
                    return {405, {{"error", "method not allowed"}}};
                auto status = engine.get_decision_status(id);
                if (!status)
                    return error_response(status.error());
                return {200, status_to_json(*status)};
            }

            if (parts.size() == 3 && parts[2] == "votes")
            {
                if (!post)
                    return {405, {{"error", "method not allowed"}}};
                return cast_vote(engine, id, body);
            }
        }

        return {404, {{"error", "not found"}}};
    }

    class WebServer::Impl
    {
    public:
        Impl(std::shared_ptr<ConsensusEngine> engine, WebServerConfig cfg)
            : engine_(std::move(engine)),
              cfg_(cfg),
              ioc_(static_cast<int>(cfg.threads)),
              acceptor_(ioc_),
              signals_(ioc_)
        {
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            tcp::endpoint endpoint{tcp::v4(), cfg_.port};
            beast::error_code ec;

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            if (cfg_.handle_signals)
            {
                signals_.add(SIGINT);
                signals_.add(SIGTERM);
                signals_.async_wait([this](beast::error_code sec, int signo) {
                    if (sec)
                        return;
                    spdlog::info("received signal {}, stopping", signo);
                    stop();
                });
            }

            do_accept();
            spdlog::info("listening on port {} with {} thread(s)", cfg_.port, cfg_.threads);

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        void stop()
        {
            beast::error_code ec;
            signals_.cancel(ec);
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (!acceptor_.is_open())
                return;
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), *engine_)->run();
            }
            do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, ConsensusEngine &engine)
                : stream_(std::move(socket)),
                  buffer_(),
                  engine_(engine)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                req_ = {};
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    return;
                }

                res_ = handle_request(req_);
                do_write();
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            http::response<http::string_body> handle_request(const http::request<http::string_body> &req)
            {
                std::string_view method(req.method_string().data(), req.method_string().size());
                std::string_view target(req.target().data(), req.target().size());

                ApiResponse api;
                std::string body;
                try
                {
                    api = handle_api_request(engine_, method, target, req.body());
                    body = api.serialize();
                }
                catch (const std::exception &e)
                {
                    spdlog::error("request {} {} failed: {}", method, target, e.what());
                    api = {500, {{"error", "internal error"}}};
                    body = api.serialize();
                }

                http::response<http::string_body> res{static_cast<http::status>(api.status), req.version()};
                res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
                res.set(http::field::content_type, "application/json");
                res.keep_alive(false);
                res.body() = std::move(body);
                res.prepare_payload();
                return res;
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            ConsensusEngine &engine_;
        };

        std::shared_ptr<ConsensusEngine> engine_;
        WebServerConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        net::signal_set signals_;
    };

    WebServer::WebServer(std::shared_ptr<ConsensusEngine> engine, const WebServerConfig &cfg)
        : impl_(std::make_unique<Impl>(std::move(engine), cfg))
    {
    }
    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace concord
