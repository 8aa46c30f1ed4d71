#include "ferry/server/session.hpp"

#include <array>
#include <exception>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace ferry::server
{

    namespace
    {

        struct StateLabel
        {
            SessionState state;
            std::string_view label;
        };

        constexpr std::array<StateLabel, 5> kStateLabels{{
            {SessionState::AwaitingCommand, "awaiting_command"},
            {SessionState::Listing, "listing"},
            {SessionState::Downloading, "downloading"},
            {SessionState::Uploading, "uploading"},
            {SessionState::Closed, "closed"},
        }};

        // Keeps a session in the registry for exactly the lifetime of its loop.
        class RegistryMembership
        {
        public:
            RegistryMembership(const ServerContext &context, const std::shared_ptr<Session> &session)
                : context_(context), session_(session.get())
            {
                const auto active = context_.registry.add(session);
                emit_metric(context_.metrics, kMetricActiveClients, static_cast<std::int64_t>(active));
            }

            ~RegistryMembership()
            {
                try
                {
                    const auto active = context_.registry.remove(session_);
                    emit_metric(context_.metrics, kMetricActiveClients, static_cast<std::int64_t>(active));
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("Failed to deregister {}: {}", session_->remote_endpoint(), ex.what());
                }
            }

            RegistryMembership(const RegistryMembership &) = delete;
            RegistryMembership &operator=(const RegistryMembership &) = delete;

        private:
            const ServerContext &context_;
            const Session *session_;
        };

    } // namespace

    std::string_view to_string(SessionState state) noexcept
    {
        for (const auto &entry : kStateLabels)
        {
            if (entry.state == state)
            {
                return entry.label;
            }
        }
        return "unknown";
    }

    Session::Session(std::unique_ptr<Connection> connection, ServerContext context)
        : connection_(std::move(connection)), context_(context) {}

    Session::~Session() = default;

    void Session::run()
    {
        RegistryMembership membership(context_, shared_from_this());
        spdlog::info("Connected: {}", remote_endpoint());

        try
        {
            serve();
        }
        catch (const ConnectionError &ex)
        {
            spdlog::warn("Session {} aborted in state {} ({}): {}", remote_endpoint(), to_string(state()),
                         ferry::to_string(ex.code()), ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Session {} failed: {}", remote_endpoint(), ex.what());
        }

        state_ = SessionState::Closed;
        connection_->close();
        spdlog::info("Connection closed: {}", remote_endpoint());
    }

    void Session::stop()
    {
        spdlog::info("Closing connection for {}", remote_endpoint());
        connection_->force_close();
    }

    void Session::serve()
    {
        std::string line;
        while (!shutting_down())
        {
            state_ = SessionState::AwaitingCommand;
            const auto status = connection_->read_command(context_.chunk_size, context_.idle_timeout, line);
            if (status == ReadStatus::TimedOut)
            {
                continue;
            }
            if (status == ReadStatus::Closed)
            {
                return;
            }
            dispatch(line);
        }
    }

    void Session::dispatch(const std::string &line)
    {
        ferry::protocol::TransferRequest request;
        try
        {
            request = ferry::protocol::parse_request(line);
        }
        catch (const ferry::protocol::ProtocolError &ex)
        {
            spdlog::debug("{} -> rejected \"{}\": {}", remote_endpoint(), line, ex.what());
            send_error(ex.what());
            return;
        }

        spdlog::debug("{} -> {}", remote_endpoint(), ferry::protocol::to_string(request));
        if (const auto *get = std::get_if<ferry::protocol::GetRequest>(&request))
        {
            handle_get(*get);
        }
        else if (const auto *put = std::get_if<ferry::protocol::PutRequest>(&request))
        {
            handle_put(*put);
        }
        else
        {
            handle_list();
        }
    }

    void Session::send(std::string_view text)
    {
        connection_->write_all(text);
    }

    void Session::send_error(std::string_view message)
    {
        send(ferry::protocol::format_error(message));
    }

    bool Session::await_acknowledgement()
    {
        std::vector<std::uint8_t> buffer(context_.chunk_size);
        for (;;)
        {
            std::size_t received = 0;
            const auto status = connection_->read_some(buffer, context_.idle_timeout, received);
            if (status == ReadStatus::Ok)
            {
                return true;
            }
            if (status == ReadStatus::Closed || shutting_down())
            {
                return false;
            }
        }
    }

} // namespace ferry::server
