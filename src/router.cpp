#include "router.hpp"

#include <variant>

#include <spdlog/spdlog.h>

#include "client_message.hpp"
#include "game_context.hpp"

namespace
{
    template <typename... Ts>
    struct Overloaded : Ts...
    {
        using Ts::operator()...;
    };
} // namespace

namespace raid_server
{
    Router::Router(InboundQueue& queue, GameContext& context) : queue_(queue), context_(context) {}

    Router::~Router()
    {
        stop();
    }

    void Router::start()
    {
        if (running_.exchange(true))
        {
            return;
        }
        thread_ = std::thread([this]() { consumeLoop(); });
    }

    void Router::stop()
    {
        running_ = false;
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    void Router::dispatch(const std::string_view connectionId, const std::string_view payload) noexcept
    {
        try
        {
            auto [status, message, error] = DecodeClientMessage(payload);
            if (status != net::parse_status::complete || !message)
            {
                spdlog::warn("Protocol error from {}: {}", connectionId, error.value_or("undecodable message"));
                return;
            }

            std::visit(
                Overloaded{
                    [&](const PlayerAction& action) {
                        spdlog::trace("player_action '{}' from {}", action.action, connectionId);
                        context_.withState(
                            [&](GameLogic& logic) { logic.onPlayerAction(connectionId, action); });
                    },
                    [&](const SkillUse& skill) {
                        spdlog::trace("skill_use {} from {}", skill.skillIndex, connectionId);
                        context_.withState([&](GameLogic& logic) { logic.onSkillUse(connectionId, skill); });
                    },
                    [&](const UnknownMessage& unknown) {
                        spdlog::debug("Dropping message of unknown type '{}' from {}", unknown.type, connectionId);
                    },
                },
                *message);
        }
        catch (const std::exception& e)
        {
            spdlog::error("Handling message from {} failed: {}", connectionId, e.what());
        }
    }

    void Router::consumeLoop()
    {
        moodycamel::ConsumerToken consumerToken(queue_);
        InboundMessage message;

        spdlog::debug("Router started");
        while (running_.load(std::memory_order_acquire))
        {
            if (queue_.wait_dequeue_timed(consumerToken, message, POLL_TIMEOUT))
            {
                dispatch(message.connectionId, message.payload);
            }
        }
        spdlog::debug("Router stopped");
    }
} // namespace raid_server
