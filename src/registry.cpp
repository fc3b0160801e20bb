#include "registry.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <ranges>

#include <spdlog/spdlog.h>

#include "connection.hpp"

namespace raid_server
{
    Registry::Registry(const size_t maxPlayers, RemovalListener onRemoved) :
        maxPlayers_(maxPlayers), onRemoved_(std::move(onRemoved))
    {
    }

    bool Registry::tryAdd(const std::shared_ptr<Connection>& connection, const AdmissionHook& onAdmitted)
    {
        const std::scoped_lock lock(mutex_);
        if (connections_.size() >= maxPlayers_)
        {
            return false;
        }

        auto id = "player_" + std::to_string(nextId_++);
        connection->assignId(id);
        if (onAdmitted)
        {
            onAdmitted(id);
        }
        connections_.emplace(std::move(id), connection);
        return true;
    }

    bool Registry::remove(const std::string_view id)
    {
        std::shared_ptr<Connection> removed;
        {
            const std::scoped_lock lock(mutex_);
            const auto it = connections_.find(std::string(id));
            if (it == connections_.end())
            {
                return false;
            }

            removed = std::move(it->second);
            connections_.erase(it);
        }

        spdlog::debug("Registry: removed {}", id);
        if (onRemoved_)
        {
            onRemoved_(removed);
        }
        return true;
    }

    std::vector<std::shared_ptr<Connection>> Registry::snapshotAll() const
    {
        const std::shared_lock lock(mutex_);
        std::vector<std::shared_ptr<Connection>> connections;

        connections.reserve(connections_.size());
        std::ranges::copy(connections_ | std::views::values, std::back_inserter(connections));
        return connections;
    }

    std::shared_ptr<Connection> Registry::find(const std::string_view id) const
    {
        const std::shared_lock lock(mutex_);
        const auto it = connections_.find(std::string(id));
        return it != connections_.end() ? it->second : nullptr;
    }

    size_t Registry::size() const
    {
        const std::shared_lock lock(mutex_);
        return connections_.size();
    }
} // namespace raid_server
