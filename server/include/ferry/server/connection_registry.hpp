#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace ferry::server
{

    class Session;

    /// Live sessions of the process. The mutex is held for a single
    /// bookkeeping step and never across socket I/O.
    class ConnectionRegistry
    {
    public:
        // Both return the number of registered sessions afterwards.
        std::size_t add(const std::shared_ptr<Session> &session);
        std::size_t remove(const Session *session);

        std::size_t count() const;

        /// Force-closes every registered session and empties the set.
        void close_all();

    private:
        mutable std::mutex mutex_;
        std::vector<std::weak_ptr<Session>> sessions_;
    };

} // namespace ferry::server
