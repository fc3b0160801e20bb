#ifndef REGISTRY_HPP
#define REGISTRY_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace raid_server
{
    class Connection;

    // Who is connected. Bounded by the player capacity; the only place where
    // connections are added or removed.
    class Registry
    {
    public:
        using RemovalListener = std::function<void(const std::shared_ptr<Connection>&)>;
        using AdmissionHook   = std::function<void(const std::string& id)>;

        // onRemoved runs once per removed connection, outside the registry lock.
        explicit Registry(size_t maxPlayers, RemovalListener onRemoved = {});

        Registry(const Registry&)            = delete;
        Registry& operator=(const Registry&) = delete;

        // False, with nothing changed, when already at capacity. Otherwise names the
        // connection "player_N" with the next never-used N and registers it.
        //
        // onAdmitted runs under the registry lock after the id is assigned and before
        // the connection becomes visible, so no removal can overtake it. It must not
        // call back into the registry. If it throws, nothing is registered and the
        // exception propagates.
        [[nodiscard]] bool tryAdd(const std::shared_ptr<Connection>& connection,
                                  const AdmissionHook& onAdmitted = {});

        // Idempotent; true only for the call that actually removed the entry.
        bool remove(std::string_view id);

        [[nodiscard]] std::vector<std::shared_ptr<Connection>> snapshotAll() const;
        [[nodiscard]] std::shared_ptr<Connection> find(std::string_view id) const;

        [[nodiscard]] size_t size() const;
        [[nodiscard]] size_t capacity() const noexcept { return maxPlayers_; }

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;

        size_t maxPlayers_;
        uint64_t nextId_ = 1;
        RemovalListener onRemoved_;
    };
} // namespace raid_server

#endif // REGISTRY_HPP
