#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "packet_buffers.hpp"
#include "parse_result.hpp"

// Wire framing: [u32 big-endian payload length][payload bytes].

namespace net
{
    enum class frame_error
    {
        truncated,
        too_large,
    };

    [[nodiscard]] std::string_view to_string(frame_error error) noexcept;

    using frame_result = parse_result<std::string, frame_error>;

    inline constexpr size_t FRAME_HEADER_SIZE      = sizeof(uint32_t);
    inline constexpr size_t DEFAULT_MAX_FRAME_SIZE = 1U << 20U;

    // Throws std::length_error when the payload does not fit the 32-bit prefix.
    [[nodiscard]] shared_bytes_ptr encode_frame(std::string_view payload);

    // Reads one frame at the reader's cursor. Reports `partial` when the header or
    // the payload is not fully available yet and `too_large` as soon as the header
    // announces more than max_frame_size bytes.
    [[nodiscard]] frame_result read_frame(packet_reader& reader, size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

    // Decodes the first frame of a stream that has already ended, so a missing
    // header or short payload is a `truncated` error rather than `partial`.
    [[nodiscard]] frame_result decode_frame(std::span<const byte> stream,
                                            size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

    // Accumulates received chunks and hands out complete frames in arrival order.
    class frame_reader
    {
    public:
        explicit frame_reader(size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE, size_t initial_capacity = 1024);

        void append(const byte* data, size_t length);

        [[nodiscard]] size_t available_bytes() const noexcept { return buffer_.size(); }

        [[nodiscard]] bool has_partial_frame() const noexcept { return !buffer_.empty(); }

        void clear() noexcept { buffer_.clear(); }

        frame_result try_read_frame();

    private:
        std::vector<byte> buffer_;
        size_t maxFrameSize_;
    };
} // namespace net

#endif // FRAME_CODEC_HPP
