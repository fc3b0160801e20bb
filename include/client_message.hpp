#ifndef CLIENT_MESSAGE_HPP
#define CLIENT_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "parse_result.hpp"

namespace raid_server
{
    struct PlayerAction
    {
        std::string action;
        nlohmann::json data;
    };

    struct SkillUse
    {
        int64_t skillIndex = 0;
        std::optional<std::string> targetId;
    };

    // A well-formed message whose `type` this server does not know.
    struct UnknownMessage
    {
        std::string type;
    };

    using ClientMessage = std::variant<PlayerAction, SkillUse, UnknownMessage>;

    using MessageDecodeResult = net::parse_result<ClientMessage, std::string>;

    // Never reports `partial`: a payload is either a message or a protocol error.
    [[nodiscard]] MessageDecodeResult DecodeClientMessage(std::string_view payload);
} // namespace raid_server

#endif // CLIENT_MESSAGE_HPP
