#ifndef INBOUND_MESSAGE_HPP
#define INBOUND_MESSAGE_HPP

#include <string>

#include <moodycamel/blockingconcurrentqueue.h>

namespace raid_server
{
    struct InboundMessage
    {
        std::string connectionId;
        std::string payload;
    };

    // Fed by every receive task, drained by the router. Each receive task enqueues
    // through its own producer token so one connection's messages stay in order.
    using InboundQueue = moodycamel::BlockingConcurrentQueue<InboundMessage>;
} // namespace raid_server

#endif // INBOUND_MESSAGE_HPP
