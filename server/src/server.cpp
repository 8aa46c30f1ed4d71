#include "ferry/server/server.hpp"

#include <asio/ip/address.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>

#include <spdlog/spdlog.h>

#include "ferry/server/connection.hpp"
#include "ferry/server/session.hpp"

namespace ferry::server
{

    Server::Server(ServerConfig config)
        : Server(config, make_storage_backend(config), std::make_unique<LogMetricsSink>())
    {
    }

    Server::Server(ServerConfig config, std::unique_ptr<StorageBackend> storage, std::unique_ptr<MetricsSink> metrics)
        : config_(std::move(config)),
          storage_(std::move(storage)),
          metrics_(std::move(metrics)),
          acceptor_(io_context_),
          signals_(io_context_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(config_.backlog);
        port_ = acceptor_.local_endpoint().port();

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    Server::~Server()
    {
        shutdown();
        registry_.close_all();
        join_workers();
    }

    void Server::run()
    {
        spdlog::info("Listening on {}:{} [{} storage]", config_.address, port(), storage_->kind());

        while (!shutdown_requested_)
        {
            reap_finished_workers();
            auto connection = std::make_unique<Connection>();
            if (!accept_one(*connection))
            {
                continue;
            }
            connection->on_accepted();
            start_worker(std::move(connection));
        }

        std::error_code ec;
        acceptor_.close(ec);
        registry_.close_all();
        join_workers();
        spdlog::info("Server stopped");
    }

    void Server::shutdown() noexcept
    {
        shutdown_requested_ = true;
    }

    bool Server::accept_one(Connection &connection)
    {
        bool done = false;
        std::error_code result;
        acceptor_.async_accept(connection.socket(), [&](const std::error_code &ec)
                               {
            result = ec;
            done = true; });

        io_context_.restart();
        const auto deadline = std::chrono::steady_clock::now() + config_.accept_timeout;
        while (!done && !shutdown_requested_)
        {
            if (io_context_.run_one_until(deadline) == 0)
            {
                break;
            }
        }
        if (!done)
        {
            std::error_code ignored;
            acceptor_.cancel(ignored);
            while (!done && io_context_.run_one() > 0)
            {
            }
        }

        if (result == asio::error::operation_aborted)
        {
            return false;
        }
        if (result)
        {
            spdlog::error("Accept error: {}", result.message());
            return false;
        }
        return true;
    }

    void Server::start_worker(std::unique_ptr<Connection> connection)
    {
        auto session = std::make_shared<Session>(std::move(connection), make_context());
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([session, done]
                           {
            try
            {
                session->run();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Worker for {} failed: {}", session->remote_endpoint(), ex.what());
            }
            done->store(true); });
        workers_.push_back(Worker{std::move(thread), std::move(done)});
        spdlog::debug("Accepted new connection, {} worker(s)", workers_.size());
    }

    void Server::reap_finished_workers()
    {
        const auto finished = std::partition(workers_.begin(), workers_.end(),
                                             [](const Worker &worker)
                                             { return !worker.done->load(); });
        for (auto it = finished; it != workers_.end(); ++it)
        {
            it->thread.join();
        }
        workers_.erase(finished, workers_.end());
    }

    void Server::join_workers()
    {
        for (auto &worker : workers_)
        {
            if (worker.thread.joinable())
            {
                worker.thread.join();
            }
        }
        workers_.clear();
    }

    void Server::handle_signal()
    {
        shutdown();
        spdlog::info("Signal received, shutting down");
    }

    ServerContext Server::make_context()
    {
        return ServerContext{
            .storage = *storage_,
            .registry = registry_,
            .metrics = *metrics_,
            .shutdown_requested = shutdown_requested_,
            .idle_timeout = config_.idle_timeout,
            .chunk_size = config_.chunk_size,
        };
    }

} // namespace ferry::server
