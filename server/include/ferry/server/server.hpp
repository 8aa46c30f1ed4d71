#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "ferry/server/config.hpp"
#include "ferry/server/connection_registry.hpp"
#include "ferry/server/metrics.hpp"
#include "ferry/server/storage.hpp"

namespace ferry::server
{

    class Connection;
    struct ServerContext;

    /// Accepts connections and runs one session per worker thread. The
    /// accept loop wakes up every accept_timeout to observe shutdown().
    class Server
    {
    public:
        explicit Server(ServerConfig config);
        Server(ServerConfig config, std::unique_ptr<StorageBackend> storage, std::unique_ptr<MetricsSink> metrics);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        /// Blocks until shutdown() is called or SIGINT/SIGTERM arrives, then
        /// closes every session and joins the workers.
        void run();

        /// Thread-safe.
        void shutdown() noexcept;

        std::uint16_t port() const noexcept { return port_; }

        ConnectionRegistry &registry() noexcept { return registry_; }
        StorageBackend &storage() noexcept { return *storage_; }

    private:
        struct Worker
        {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        bool accept_one(Connection &connection);
        void start_worker(std::unique_ptr<Connection> connection);
        void reap_finished_workers();
        void join_workers();
        void handle_signal();
        ServerContext make_context();

        ServerConfig config_;
        std::unique_ptr<StorageBackend> storage_;
        std::unique_ptr<MetricsSink> metrics_;
        ConnectionRegistry registry_;
        std::atomic<bool> shutdown_requested_{false};

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        std::uint16_t port_{};

        std::vector<Worker> workers_;
    };

} // namespace ferry::server
