#include "broadcaster.hpp"

#include <memory>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "connection.hpp"
#include "frame_codec.hpp"
#include "registry.hpp"

namespace raid_server
{
    Broadcaster::Broadcaster(Registry& registry) : registry_(registry) {}

    size_t Broadcaster::broadcast(const GameStateSnapshot& snapshot)
    {
        const auto connections = registry_.snapshotAll();
        if (connections.empty())
        {
            return 0;
        }

        // Invalid UTF-8 in any string becomes U+FFFD rather than failing the whole tick
        const auto frame = net::encode_frame(
            nlohmann::json(snapshot).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

        size_t delivered = 0;
        std::vector<std::shared_ptr<Connection>> failed;
        for (const auto& connection : connections)
        {
            if (connection->sendOne(frame))
            {
                ++delivered;
            }
            else
            {
                failed.push_back(connection);
            }
        }

        for (const auto& connection : failed)
        {
            spdlog::debug("Broadcast to {} failed, dropping it", connection->id());
            registry_.remove(connection->id());
            connection->close();
        }

        return delivered;
    }
} // namespace raid_server
