#include "connection.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

namespace raid_server
{
    using boost::asio::redirect_error;
    using boost::asio::ip::tcp;

    void ConfigureClientSocket(tcp::socket& socket)
    {
        boost::system::error_code ec;
        socket.set_option(tcp::no_delay(true), ec);
        if (ec)
        {
            spdlog::debug("Could not disable Nagle: {}", ec.message());
        }

        socket.set_option(tcp::socket::keep_alive(true), ec);
        if (ec)
        {
            spdlog::debug("Could not enable keep-alive: {}", ec.message());
        }
    }

    Connection::Connection(tcp::socket socket, const size_t maxFrameSize, const size_t maxPendingFrames) :
        socket_(std::move(socket)), strand_(boost::asio::make_strand(socket_.get_executor())), timer_(strand_),
        reader_(maxFrameSize), incoming_(4096), maxPendingFrames_(maxPendingFrames), producer_(pending_)
    {
        timer_.expires_at(std::chrono::steady_clock::time_point::max());

        boost::system::error_code ec;
        if (const auto endpoint = socket_.remote_endpoint(ec); !ec)
        {
            remoteAddress_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
        else
        {
            remoteAddress_ = "unknown";
        }
    }

    Connection::~Connection()
    {
        connected_ = false;

        // Drop whatever the writer never got to
        moodycamel::ConsumerToken consumerToken(pending_);
        net::shared_bytes_ptr frame;
        while (pending_.try_dequeue(consumerToken, frame))
        {
        }

        spdlog::debug("Connection {} ({}) destroyed", id_.empty() ? "unregistered" : id_, remoteAddress_);
    }

    void Connection::start()
    {
        boost::asio::co_spawn(
            strand_, [self = shared_from_this()]() -> awaitable<void> { co_await self->writer(); },
            boost::asio::detached);
    }

    awaitable<std::optional<std::string>> Connection::receiveOne()
    {
        while (isConnected())
        {
            auto result = reader_.try_read_frame();
            if (result.status == net::parse_status::complete)
            {
                co_return std::move(result.data);
            }

            if (result.status == net::parse_status::error)
            {
                spdlog::warn("Dropping {}: {}", id_, net::to_string(*result.error));
                co_return std::nullopt;
            }

            boost::system::error_code ec;
            const size_t read =
                co_await socket_.async_read_some(boost::asio::buffer(incoming_), redirect_error(use_awaitable, ec));

            if (ec || read == 0)
            {
                if (reader_.has_partial_frame())
                {
                    spdlog::info("{} went away mid-message: {}", id_, net::to_string(net::frame_error::truncated));
                }
                else if (ec == boost::asio::error::eof)
                {
                    spdlog::info("{} closed the connection", id_);
                }
                else if (ec == boost::asio::error::operation_aborted)
                {
                    spdlog::debug("Receive on {} cancelled", id_);
                }
                else
                {
                    spdlog::info("Receive error from {}: {}", id_, ec.message());
                }
                co_return std::nullopt;
            }

            reader_.append(incoming_.data(), read);
        }

        co_return std::nullopt;
    }

    bool Connection::sendOne(const net::shared_bytes_ptr& frame)
    {
        {
            const std::scoped_lock lock(sendMutex_);
            if (!isConnected())
            {
                return false;
            }

            if (pending_.size_approx() >= maxPendingFrames_)
            {
                if (markDisconnected())
                {
                    spdlog::warn("{} is not keeping up, {} frames pending", id_, pending_.size_approx());
                }
                return false;
            }

            pending_.enqueue(producer_, frame);
        }

        // wake up the writer if sleeping
        boost::asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
        return true;
    }

    awaitable<void> Connection::reject(const std::string_view notice)
    {
        markDisconnected();

        boost::system::error_code ec;
        co_await boost::asio::async_write(socket_, boost::asio::buffer(notice.data(), notice.size()),
                                          redirect_error(use_awaitable, ec));
        if (ec)
        {
            spdlog::debug("Could not deliver rejection to {}: {}", remoteAddress_, ec.message());
        }

        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::close()
    {
        markDisconnected();
        if (closeRequested_.exchange(true))
        {
            return;
        }

        boost::asio::post(strand_, [self = shared_from_this()]() {
            boost::system::error_code ec;
            self->socket_.shutdown(tcp::socket::shutdown_both, ec);
            self->socket_.close(ec);
            self->timer_.cancel();
        });
    }

    bool Connection::markDisconnected() noexcept
    {
        return connected_.exchange(false, std::memory_order_acq_rel);
    }

    awaitable<void> Connection::writer()
    {
        static constexpr auto IDLE_WAIT   = std::chrono::milliseconds(100);
        static constexpr size_t MAX_BATCH = 16;

        try
        {
            moodycamel::ConsumerToken consumerToken(pending_);
            std::vector<net::shared_bytes_ptr> batch;
            std::vector<boost::asio::const_buffer> buffers;
            batch.reserve(MAX_BATCH);
            buffers.reserve(MAX_BATCH);

            net::shared_bytes_ptr frame;
            while (isConnected())
            {
                while (batch.size() < MAX_BATCH && pending_.try_dequeue(consumerToken, frame))
                {
                    batch.push_back(std::move(frame));
                }

                if (!batch.empty())
                {
                    // Vectored write of everything collected
                    buffers.clear();
                    for (const auto& queued : batch)
                    {
                        buffers.emplace_back(queued->data(), queued->size());
                    }

                    boost::system::error_code ec;
                    co_await boost::asio::async_write(socket_, buffers, redirect_error(use_awaitable, ec));
                    batch.clear();

                    if (ec)
                    {
                        if (markDisconnected())
                        {
                            spdlog::info("Send to {} failed: {}", id_, ec.message());
                        }
                        co_return;
                    }
                    continue;
                }

                boost::system::error_code ec;
                timer_.expires_after(IDLE_WAIT);
                co_await timer_.async_wait(redirect_error(use_awaitable, ec));

                if (ec && ec != boost::asio::error::operation_aborted)
                {
                    co_return; // io_context stopped
                }
            }
        }
        catch (const std::exception& e)
        {
            markDisconnected();
            spdlog::error("Writer for {} failed: {}", id_, e.what());
        }
    }
} // namespace raid_server
