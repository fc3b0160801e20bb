#ifndef SERVER_HPP
#define SERVER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include <boost/asio.hpp>

#include "inbound_message.hpp"
#include "router.hpp"
#include "server_config.hpp"

namespace raid_server
{
    using boost::asio::awaitable;
    using boost::asio::use_awaitable;

    class Broadcaster;
    class Connection;
    class GameContext;
    class Registry;
    class SimulationClock;

    class Server
    {
    public:
        // Sent unframed to a client that connects while the server is full.
        static constexpr std::string_view REJECTION_NOTICE = "Server full";

        explicit Server(GameContext& context);
        ~Server();

        Server(const Server&)            = delete;
        Server& operator=(const Server&) = delete;

        // Binds, then starts accepting, routing and ticking. Throws
        // boost::system::system_error if the listener cannot be set up, in which
        // case nothing has been started. Throws std::logic_error unless the server
        // is freshly constructed.
        void start(const ServerConfig& config);

        // Stops everything and waits for the worker threads. A stopped server
        // cannot be started again.
        void stop();

        // Blocks the calling thread until SIGINT or SIGTERM arrives.
        static void waitForSignal();

        [[nodiscard]] bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

        // Port actually bound by start(); useful when configured with port 0.
        [[nodiscard]] uint16_t port() const noexcept { return port_; }

        [[nodiscard]] const Registry& registry() const;

    private:
        enum class State
        {
            Created,
            Started,
            Stopped,
        };

        awaitable<void> listener();
        awaitable<void> receiveLoop(std::shared_ptr<Connection> connection);
        void onConnectionRemoved(const std::shared_ptr<Connection>& connection);

        GameContext& context_;
        ServerConfig config_;

        std::mutex lifecycleMutex_;
        State state_ = State::Created;
        std::atomic<bool> running_{false};

        boost::asio::io_context ioContext_;
        std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
        std::unique_ptr<boost::asio::thread_pool> threadPool_;
        std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
        uint16_t port_ = 0;

        InboundQueue inbound_;
        std::unique_ptr<Registry> registry_;
        std::unique_ptr<Broadcaster> broadcaster_;
        std::unique_ptr<SimulationClock> clock_;
        Router router_;
    };
} // namespace raid_server

#endif // SERVER_HPP
