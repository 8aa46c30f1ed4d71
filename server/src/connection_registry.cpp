#include "ferry/server/connection_registry.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "ferry/server/session.hpp"

namespace ferry::server
{

    std::size_t ConnectionRegistry::add(const std::shared_ptr<Session> &session)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<Session> &weak)
                                       { return weak.expired(); }),
                        sessions_.end());
        sessions_.push_back(session);
        return sessions_.size();
    }

    std::size_t ConnectionRegistry::remove(const Session *session)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [session](const std::weak_ptr<Session> &weak)
                                       {
                                           auto ptr = weak.lock();
                                           return !ptr || ptr.get() == session;
                                       }),
                        sessions_.end());
        return sessions_.size();
    }

    std::size_t ConnectionRegistry::count() const
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(),
                                                      [](const std::weak_ptr<Session> &weak)
                                                      { return !weak.expired(); }));
    }

    void ConnectionRegistry::close_all()
    {
        std::vector<std::shared_ptr<Session>> live;
        {
            std::lock_guard lock(mutex_);
            for (const auto &weak : sessions_)
            {
                if (auto session = weak.lock())
                {
                    live.push_back(std::move(session));
                }
            }
            sessions_.clear();
        }
        if (!live.empty())
        {
            spdlog::info("Closing {} active connection(s)", live.size());
        }
        for (const auto &session : live)
        {
            session->stop();
        }
    }

} // namespace ferry::server
