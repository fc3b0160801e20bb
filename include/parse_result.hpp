#ifndef PARSE_RESULT_HPP
#define PARSE_RESULT_HPP

#include <optional>
#include <utility>

namespace net
{
    enum class parse_status
    {
        complete,
        partial,
        error,
    };

    // Outcome of decoding something from a byte stream or a text payload.
    // `partial` means more input is required; only `complete` carries data.
    template <typename T, typename E>
    struct parse_result
    {
        parse_status status;
        std::optional<T> data;
        std::optional<E> error;

        [[nodiscard]] static parse_result complete(T value)
        {
            return {.status = parse_status::complete, .data = std::move(value), .error = std::nullopt};
        }

        [[nodiscard]] static parse_result partial()
        {
            return {.status = parse_status::partial, .data = std::nullopt, .error = std::nullopt};
        }

        [[nodiscard]] static parse_result failure(E reason)
        {
            return {.status = parse_status::error, .data = std::nullopt, .error = std::move(reason)};
        }

        [[nodiscard]] bool ok() const noexcept { return status == parse_status::complete; }
    };
} // namespace net

#endif // PARSE_RESULT_HPP
