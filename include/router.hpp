#ifndef ROUTER_HPP
#define ROUTER_HPP

#include <atomic>
#include <chrono>
#include <string_view>
#include <thread>

#include "inbound_message.hpp"

namespace raid_server
{
    class GameContext;

    class Router final
    {
    public:
        static constexpr auto POLL_TIMEOUT = std::chrono::milliseconds(100);

        Router(InboundQueue& queue, GameContext& context);
        ~Router();

        Router(const Router&)            = delete;
        Router& operator=(const Router&) = delete;

        // Starts the consume thread; no-op while already running.
        void start();
        // Returns once the consume thread has observed the stop and exited.
        void stop();

        // Decodes one payload and applies it to the game. Malformed payloads and
        // unknown message kinds are dropped; nothing here ever throws.
        void dispatch(std::string_view connectionId, std::string_view payload) noexcept;

        [[nodiscard]] bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    private:
        void consumeLoop();

        InboundQueue& queue_;
        GameContext& context_;
        std::atomic<bool> running_{false};
        std::thread thread_;
    };
} // namespace raid_server

#endif // ROUTER_HPP
