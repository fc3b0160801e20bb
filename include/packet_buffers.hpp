#ifndef PACKET_BUFFERS_HPP
#define PACKET_BUFFERS_HPP

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <iterator>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

// -----------------------------------------------------------------------------
// Byte buffer utilities for the framed wire protocol.
// Provides:
//   • net::shared_bytes   – immutable, shareable frame handed to many writers
//   • net::packet_writer  – owning, append-only buffer for outgoing frames
//   • net::packet_reader  – non-owning view that tracks a read offset
// -----------------------------------------------------------------------------

namespace net
{
    using byte = std::byte;

    // Immutable bytes shared between every connection a frame is queued to.
    struct shared_bytes final
    {
        explicit shared_bytes(std::vector<byte>&& data) : _data(std::move(data)) {}

        [[nodiscard]] const byte* data() const noexcept { return _data.data(); }
        [[nodiscard]] size_t size() const noexcept { return _data.size(); }
        [[nodiscard]] std::span<const byte> view() const noexcept { return _data; }

    private:
        std::vector<byte> _data;
    };

    using shared_bytes_ptr = std::shared_ptr<const shared_bytes>;

    // -----------------------------------------------------------
    // packet_writer – append-only binary buffer for outgoing frames.
    // -----------------------------------------------------------
    class packet_writer
    {
    public:
        packet_writer() noexcept = default;

        void reserve(const std::size_t bytes) { _buffer.reserve(bytes); }

        template <typename T> requires std::is_trivially_copyable_v<T>
        void write(const T& value)
        {
            write_bytes(std::as_bytes(std::span{&value, 1}));
        }

        void write_bytes(const std::span<const byte> bytes)
        {
            std::ranges::copy(bytes, std::back_inserter(_buffer));
        }

        void write_string(const std::string_view str)
        {
            write_bytes(std::as_bytes(std::span{str}));
        }

        template <typename T> requires std::is_integral_v<T>
        void write_be(T v)
        {
            write(std::endian::native == std::endian::big ? v : std::byteswap(v));
        }

        [[nodiscard]] std::span<const byte> span() const noexcept { return _buffer; }
        [[nodiscard]] size_t size() const noexcept { return _buffer.size(); }

        [[nodiscard]] shared_bytes_ptr to_shared() &&
        {
            return std::make_shared<const shared_bytes>(std::move(_buffer));
        }

        void clear() noexcept { _buffer.clear(); }

    private:
        std::vector<byte> _buffer;
    };

    // -----------------------------------------------------------
    // packet_reader – span-based cursor over received bytes.
    // -----------------------------------------------------------
    class packet_reader
    {
    public:
        explicit packet_reader(const std::span<const byte> data) noexcept : _data(data) {}

        // Reads fail with errc::message_size when fewer bytes remain than requested.
        template <typename T> requires std::is_trivially_copyable_v<T>
        [[nodiscard]] std::expected<T, std::error_code> read()
        {
            if (!can_read(sizeof(T)))
            {
                return std::unexpected(std::make_error_code(std::errc::message_size));
            }

            T value;
            std::memcpy(&value, _data.data() + _consumed, sizeof(T));
            _consumed += sizeof(T);
            return value;
        }

        [[nodiscard]] std::expected<std::span<const byte>, std::error_code> read_bytes(const size_t len)
        {
            if (!can_read(len))
            {
                return std::unexpected(std::make_error_code(std::errc::message_size));
            }

            auto view = _data.subspan(_consumed, len);
            _consumed += len;
            return view;
        }

        template <typename T> requires std::is_integral_v<T>
        [[nodiscard]] std::expected<T, std::error_code> read_be()
        {
            const auto v = read<T>();
            if (!v)
            {
                return std::unexpected(v.error());
            }

            if constexpr (std::endian::native == std::endian::big)
            {
                return *v;
            }
            else
            {
                return std::byteswap(*v);
            }
        }

        [[nodiscard]] bool can_read(const size_t bytes) const noexcept
        {
            return bytes <= _data.size() - _consumed;
        }

        [[nodiscard]] size_t bytes_read() const noexcept { return _consumed; }
        [[nodiscard]] size_t bytes_remaining() const noexcept { return _data.size() - _consumed; }

        void reset() noexcept { _consumed = 0; }

    private:
        std::span<const byte> _data;
        std::size_t _consumed = 0;
    };
} // namespace net

#endif // PACKET_BUFFERS_HPP
