#include "client_message.hpp"

namespace
{
    using namespace raid_server;

    MessageDecodeResult DecodePlayerAction(const nlohmann::json& body)
    {
        const auto action = body.find("action");
        if (action == body.end() || !action->is_string())
        {
            return MessageDecodeResult::failure("player_action requires a string 'action'");
        }

        const auto data = body.find("data");
        if (data == body.end())
        {
            return MessageDecodeResult::failure("player_action requires 'data'");
        }

        return MessageDecodeResult::complete(PlayerAction{.action = action->get<std::string>(), .data = *data});
    }

    MessageDecodeResult DecodeSkillUse(const nlohmann::json& body)
    {
        const auto index = body.find("skill_index");
        if (index == body.end() || !index->is_number_integer())
        {
            return MessageDecodeResult::failure("skill_use requires an integer 'skill_index'");
        }

        const auto target = body.find("target_id");
        if (target == body.end() || !(target->is_string() || target->is_null()))
        {
            return MessageDecodeResult::failure("skill_use requires 'target_id' as string or null");
        }

        SkillUse skill{.skillIndex = index->get<int64_t>()};
        if (target->is_string())
        {
            skill.targetId = target->get<std::string>();
        }
        return MessageDecodeResult::complete(std::move(skill));
    }
} // namespace

namespace raid_server
{
    MessageDecodeResult DecodeClientMessage(const std::string_view payload)
    {
        const auto body = nlohmann::json::parse(payload, nullptr, false);
        if (body.is_discarded())
        {
            return MessageDecodeResult::failure("payload is not valid JSON");
        }

        if (!body.is_object())
        {
            return MessageDecodeResult::failure("payload is not a JSON object");
        }

        const auto type = body.find("type");
        if (type == body.end() || !type->is_string())
        {
            return MessageDecodeResult::failure("message has no string 'type'");
        }

        const auto& kind = type->get_ref<const std::string&>();
        if (kind == "player_action")
        {
            return DecodePlayerAction(body);
        }
        if (kind == "skill_use")
        {
            return DecodeSkillUse(body);
        }

        return MessageDecodeResult::complete(UnknownMessage{.type = kind});
    }
} // namespace raid_server
