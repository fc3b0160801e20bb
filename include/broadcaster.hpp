#ifndef BROADCASTER_HPP
#define BROADCASTER_HPP

#include <cstddef>

#include "game_state.hpp"

namespace raid_server
{
    class Registry;

    class Broadcaster final
    {
    public:
        explicit Broadcaster(Registry& registry);

        // Serializes and frames the snapshot once, queues that same frame to every
        // registered connection, then unregisters and closes the ones that refused
        // it. Returns how many connections accepted the frame.
        size_t broadcast(const GameStateSnapshot& snapshot);

    private:
        Registry& registry_;
    };
} // namespace raid_server

#endif // BROADCASTER_HPP
