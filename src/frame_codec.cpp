#include "frame_codec.hpp"

#include <limits>
#include <stdexcept>

namespace net
{
    std::string_view to_string(const frame_error error) noexcept
    {
        switch (error)
        {
        case frame_error::truncated:
            return "truncated frame";
        case frame_error::too_large:
            return "frame exceeds maximum size";
        }
        return "unknown frame error";
    }

    shared_bytes_ptr encode_frame(const std::string_view payload)
    {
        if (payload.size() > std::numeric_limits<uint32_t>::max())
        {
            throw std::length_error("frame payload exceeds 32-bit length prefix");
        }

        packet_writer writer;
        writer.reserve(FRAME_HEADER_SIZE + payload.size());
        writer.write_be(static_cast<uint32_t>(payload.size()));
        writer.write_string(payload);
        return std::move(writer).to_shared();
    }

    frame_result read_frame(packet_reader& reader, const size_t max_frame_size)
    {
        const auto length = reader.read_be<uint32_t>();
        if (!length)
        {
            return frame_result::partial();
        }

        if (*length > max_frame_size)
        {
            return frame_result::failure(frame_error::too_large);
        }

        const auto payload = reader.read_bytes(*length);
        if (!payload)
        {
            return frame_result::partial();
        }

        return frame_result::complete(std::string(reinterpret_cast<const char*>(payload->data()), payload->size()));
    }

    frame_result decode_frame(const std::span<const byte> stream, const size_t max_frame_size)
    {
        packet_reader reader(stream);
        auto result = read_frame(reader, max_frame_size);
        if (result.status == parse_status::partial)
        {
            return frame_result::failure(frame_error::truncated);
        }
        return result;
    }

    frame_reader::frame_reader(const size_t max_frame_size, const size_t initial_capacity) :
        maxFrameSize_(max_frame_size)
    {
        buffer_.reserve(initial_capacity);
    }

    void frame_reader::append(const byte* data, const size_t length)
    {
        buffer_.insert(std::end(buffer_), data, data + length);
    }

    frame_result frame_reader::try_read_frame()
    {
        if (buffer_.empty())
        {
            return frame_result::partial();
        }

        packet_reader view(buffer_);
        auto result = read_frame(view, maxFrameSize_);

        if (result.status == parse_status::complete)
        {
            if (const size_t consumed = view.bytes_read(); consumed == buffer_.size())
            {
                buffer_.clear();
            }
            else
            {
                buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<ptrdiff_t>(consumed));
            }

            if (buffer_.capacity() > 16384U && buffer_.size() < (buffer_.capacity() >> 2))
            {
                buffer_.shrink_to_fit();
            }
        }

        return result;
    }
} // namespace net
