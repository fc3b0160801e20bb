#include "server.hpp"

#include <algorithm>
#include <csignal>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "broadcaster.hpp"
#include "connection.hpp"
#include "game_context.hpp"
#include "registry.hpp"
#include "simulation_clock.hpp"

namespace raid_server
{
    using boost::asio::redirect_error;
    using boost::asio::ip::tcp;

    Server::Server(GameContext& context) : context_(context), router_(inbound_, context) {}

    Server::~Server()
    {
        stop();
    }

    void Server::start(const ServerConfig& config)
    {
        const std::scoped_lock lock(lifecycleMutex_);
        if (state_ == State::Started)
        {
            throw std::logic_error("server is already running");
        }
        if (state_ == State::Stopped)
        {
            throw std::logic_error("a stopped server cannot be restarted");
        }

        config_ = config;

        try
        {
            tcp::resolver resolver(ioContext_);
            const tcp::endpoint endpoint =
                *resolver.resolve(config_.host, std::to_string(config_.port), tcp::resolver::passive).begin();

            auto acceptor = std::make_unique<tcp::acceptor>(boost::asio::make_strand(ioContext_));
            acceptor->open(endpoint.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(endpoint);
            acceptor->listen();

            port_     = acceptor->local_endpoint().port();
            acceptor_ = std::move(acceptor);
        }
        catch (const boost::system::system_error& e)
        {
            spdlog::error("Failed to open listener on {}:{}: {}", config_.host, config_.port, e.what());
            throw;
        }

        registry_ = std::make_unique<Registry>(
            config_.maxPlayers, [this](const std::shared_ptr<Connection>& connection) { onConnectionRemoved(connection); });
        broadcaster_ = std::make_unique<Broadcaster>(*registry_);
        clock_       = std::make_unique<SimulationClock>(ioContext_.get_executor(), context_, *broadcaster_,
                                                   config_.frameInterval);

        running_ = true;
        state_   = State::Started;

        workGuard_.emplace(boost::asio::make_work_guard(ioContext_));
        boost::asio::co_spawn(acceptor_->get_executor(), listener(), boost::asio::detached);
        router_.start();
        clock_->start();

        const size_t threadCount = std::max<size_t>(1, config_.threadCount);
        threadPool_              = std::make_unique<boost::asio::thread_pool>(threadCount);
        for (size_t i = 0; i < threadCount; ++i)
        {
            boost::asio::post(*threadPool_, [this]() { ioContext_.run(); });
        }

        spdlog::info("Listening on {}:{} for up to {} players ({} threads)", config_.host, port_, config_.maxPlayers,
                     threadCount);
    }

    void Server::stop()
    {
        const std::scoped_lock lock(lifecycleMutex_);
        if (state_ != State::Started)
        {
            state_ = State::Stopped;
            return;
        }

        spdlog::info("Server shutting down");
        running_ = false;

        router_.stop();
        clock_->stop();

        boost::asio::post(acceptor_->get_executor(), [this]() {
            boost::system::error_code ec;
            acceptor_->close(ec);
        });

        // In-flight receives and writes fail on their own once the sockets close
        for (const auto& connection : registry_->snapshotAll())
        {
            connection->close();
        }

        workGuard_.reset();
        threadPool_->join();

        state_ = State::Stopped;
        spdlog::info("Server stopped");
    }

    void Server::waitForSignal()
    {
        boost::asio::io_context signalContext;
        boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, const int signal) {
            if (!ec)
            {
                spdlog::info("Received signal {}", signal);
            }
        });
        signalContext.run();
    }

    const Registry& Server::registry() const
    {
        if (registry_ == nullptr)
        {
            throw std::logic_error("server has not been started");
        }
        return *registry_;
    }

    awaitable<void> Server::listener()
    {
        while (running_)
        {
            tcp::socket socket(ioContext_);
            boost::system::error_code ec;

            co_await acceptor_->async_accept(socket, redirect_error(use_awaitable, ec));

            if (ec)
            {
                if (!running_ || ec == boost::asio::error::operation_aborted)
                {
                    break;
                }
                spdlog::error("Accept error: {}", ec.message());
                continue;
            }

            ConfigureClientSocket(socket);

            const auto connection =
                std::make_shared<Connection>(std::move(socket), config_.maxFrameSize, config_.maxPendingFrames);

            bool admitted = false;
            try
            {
                // Joining inside the admission keeps the leave for this id strictly after it
                admitted = registry_->tryAdd(connection, [this](const std::string& id) {
                    context_.withState([&id](GameLogic& logic) { logic.onPlayerJoined(id); });
                });
            }
            catch (const std::exception& e)
            {
                spdlog::error("Adding {} to the game failed: {}", connection->id(), e.what());
                continue;
            }

            if (!admitted)
            {
                spdlog::info("Server full, refusing {}", connection->remoteAddress());
                boost::asio::co_spawn(
                    connection->strand(),
                    [connection]() -> awaitable<void> { co_await connection->reject(REJECTION_NOTICE); },
                    boost::asio::detached);
                continue;
            }

            const std::string& id = connection->id();
            spdlog::info("Player {} connected from {}", id, connection->remoteAddress());

            connection->start();
            boost::asio::co_spawn(connection->strand(), receiveLoop(connection), boost::asio::detached);
        }

        spdlog::debug("Listener stopped");
    }

    awaitable<void> Server::receiveLoop(std::shared_ptr<Connection> connection)
    {
        try
        {
            // One producer per connection keeps its messages in receive order
            moodycamel::ProducerToken producer(inbound_);

            while (running_ && connection->isConnected())
            {
                auto payload = co_await connection->receiveOne();
                if (!payload)
                {
                    break;
                }

                inbound_.enqueue(producer, InboundMessage{connection->id(), std::move(*payload)});
            }
        }
        catch (const std::exception& e)
        {
            spdlog::error("Receive loop for {} failed: {}", connection->id(), e.what());
        }

        registry_->remove(connection->id());
    }

    void Server::onConnectionRemoved(const std::shared_ptr<Connection>& connection)
    {
        connection->close();

        try
        {
            context_.withState([&connection](GameLogic& logic) { logic.onPlayerLeft(connection->id()); });
        }
        catch (const std::exception& e)
        {
            spdlog::error("Removing {} from the game failed: {}", connection->id(), e.what());
        }

        spdlog::info("Player {} disconnected", connection->id());
    }
} // namespace raid_server
