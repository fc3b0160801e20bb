#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

#include "connection.hpp"
#include "frame_codec.hpp"
#include "simulation_clock.hpp"

namespace raid_server
{
    struct ServerConfig
    {
        std::string host   = "0.0.0.0";
        uint16_t port      = 8080; // 0 picks an ephemeral port
        size_t maxPlayers  = 4;
        size_t threadCount = std::max(1U, std::thread::hardware_concurrency());
        size_t maxFrameSize     = net::DEFAULT_MAX_FRAME_SIZE;
        size_t maxPendingFrames = Connection::DEFAULT_MAX_PENDING_FRAMES;
        std::chrono::nanoseconds frameInterval = SimulationClock::DEFAULT_FRAME_INTERVAL;
    };
} // namespace raid_server

#endif // SERVER_CONFIG_HPP
