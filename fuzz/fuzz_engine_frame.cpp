#include <string>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "engine_message.h"
#include "engine_protocol.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    const std::string_view frame(reinterpret_cast<const char*>(data), size);

    const auto parts = tcpengine::protocol::split_on_separator(frame);
    (void)tcpengine::protocol::printable_frame(frame);
    if (!parts.tail.has_value())
    {
        return 0;
    }

    const auto message_parts = tcpengine::protocol::split_on_separator(*parts.tail);
    if (message_parts.tail.has_value())
    {
        (void)tcpengine::parse_engine_message(*message_parts.tail);
    }

    if (tcpengine::protocol::is_valid_operation_id(*parts.tail))
    {
        const std::string encoded = tcpengine::protocol::encode_frame(parts.head, *parts.tail);
        if (encoded.back() != tcpengine::protocol::kEndOfMessage)
        {
            __builtin_trap();
        }
    }

    return 0;
}
