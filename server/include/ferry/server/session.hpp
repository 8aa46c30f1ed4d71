#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "ferry/protocol.hpp"
#include "ferry/server/connection.hpp"
#include "ferry/server/connection_registry.hpp"
#include "ferry/server/metrics.hpp"
#include "ferry/server/storage.hpp"

namespace ferry::server
{

    /// Process-wide collaborators handed to every session.
    struct ServerContext
    {
        StorageBackend &storage;
        ConnectionRegistry &registry;
        MetricsSink &metrics;
        const std::atomic<bool> &shutdown_requested;
        std::chrono::milliseconds idle_timeout;
        std::size_t chunk_size;
    };

    enum class SessionState : std::uint8_t
    {
        AwaitingCommand,
        Listing,
        Downloading,
        Uploading,
        Closed
    };

    std::string_view to_string(SessionState state) noexcept;

    /// One connection's command loop. run() blocks on the worker thread
    /// until the peer disconnects, a stream error occurs or the server
    /// shuts down.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(std::unique_ptr<Connection> connection, ServerContext context);
        ~Session();

        void run();

        /// Thread-safe. Aborts the blocking I/O of run().
        void stop();

        SessionState state() const noexcept { return state_.load(); }

        const std::string &remote_endpoint() const noexcept { return connection_->remote_endpoint(); }

    private:
        void serve();
        void dispatch(const std::string &line);

        void handle_list();
        void handle_get(const ferry::protocol::GetRequest &request);
        void handle_put(const ferry::protocol::PutRequest &request);

        void send(std::string_view text);
        void send_error(std::string_view message);

        // Waits for any bytes from the peer, re-checking shutdown on idle timeouts.
        bool await_acknowledgement();

        bool shutting_down() const noexcept { return context_.shutdown_requested.load(); }

        std::unique_ptr<Connection> connection_;
        ServerContext context_;
        std::atomic<SessionState> state_{SessionState::AwaitingCommand};
    };

} // namespace ferry::server
