#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <moodycamel/concurrentqueue.h>

#include "frame_codec.hpp"
#include "packet_buffers.hpp"

namespace raid_server
{
    using boost::asio::awaitable;
    using boost::asio::use_awaitable;

    // Options every accepted client socket gets: no Nagle delay, TCP keep-alive so
    // vanished peers are eventually detected. Failures are logged, not fatal.
    void ConfigureClientSocket(boost::asio::ip::tcp::socket& socket);

    // One client socket. Reads happen through receiveOne() on the connection's
    // strand; writes are queued by sendOne() and drained by a single writer task
    // on the same strand, so frames never interleave on the wire.
    class Connection final : public std::enable_shared_from_this<Connection>
    {
    public:
        static constexpr size_t DEFAULT_MAX_PENDING_FRAMES = 256;

        explicit Connection(boost::asio::ip::tcp::socket socket,
                            size_t maxFrameSize     = net::DEFAULT_MAX_FRAME_SIZE,
                            size_t maxPendingFrames = DEFAULT_MAX_PENDING_FRAMES);
        ~Connection();

        Connection(const Connection&)            = delete;
        Connection& operator=(const Connection&) = delete;

        // Starts the writer task. Call once, after the connection is registered.
        void start();

        // Resolves to the next complete payload, or nullopt once the peer is gone,
        // a frame is truncated or oversized, or the socket errors.
        awaitable<std::optional<std::string>> receiveOne();

        // Queues an encoded frame. False when the connection is no longer live or
        // the peer has fallen too far behind (which also marks it dead).
        bool sendOne(const net::shared_bytes_ptr& frame);

        // Sends raw, unframed bytes and closes. Used for the capacity notice.
        awaitable<void> reject(std::string_view notice);

        // Idempotent. Marks the connection dead and closes the socket on the strand.
        void close();

        [[nodiscard]] bool isConnected() const noexcept { return connected_.load(std::memory_order_acquire); }

        [[nodiscard]] const std::string& id() const noexcept { return id_; }
        [[nodiscard]] const std::string& remoteAddress() const noexcept { return remoteAddress_; }
        [[nodiscard]] const boost::asio::strand<boost::asio::any_io_executor>& strand() const noexcept { return strand_; }

    private:
        friend class Registry;

        void assignId(std::string id) { id_ = std::move(id); }

        // True only for the call that performed the live -> dead transition.
        bool markDisconnected() noexcept;

        awaitable<void> writer();

        boost::asio::ip::tcp::socket socket_;
        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::asio::steady_timer timer_;

        std::string id_;
        std::string remoteAddress_;
        std::atomic<bool> connected_{true};
        std::atomic<bool> closeRequested_{false};

        net::frame_reader reader_;
        std::vector<std::byte> incoming_;

        size_t maxPendingFrames_;
        moodycamel::ConcurrentQueue<net::shared_bytes_ptr> pending_;
        // Single producer token behind a lock: frames leave in the order they were queued.
        std::mutex sendMutex_;
        moodycamel::ProducerToken producer_;
    };
} // namespace raid_server

#endif // CONNECTION_HPP
