#include <string>
#include <cstddef>
#include <string_view>

#include "engine_protocol.h"

namespace tcpengine::protocol
{

split_result split_on_separator(const std::string_view data)
{
    const std::size_t pos = data.find(kSeparator);
    if (pos == std::string_view::npos)
    {
        return split_result{.head = data, .tail = std::nullopt};
    }
    return split_result{.head = data.substr(0, pos), .tail = data.substr(pos + 1)};
}

std::string encode_frame(const std::string_view command)
{
    std::string frame;
    frame.reserve(command.size() + 1);
    frame.append(command);
    frame.push_back(kEndOfMessage);
    return frame;
}

std::string encode_frame(const std::string_view command, const std::string_view payload)
{
    std::string frame;
    frame.reserve(command.size() + payload.size() + 2);
    frame.append(command);
    frame.push_back(kSeparator);
    frame.append(payload);
    frame.push_back(kEndOfMessage);
    return frame;
}

std::string encode_message_frame(const std::string_view operation_id, const std::string_view json)
{
    std::string frame;
    frame.reserve(kCmdMessage.size() + operation_id.size() + json.size() + 3);
    frame.append(kCmdMessage);
    frame.push_back(kSeparator);
    frame.append(operation_id);
    frame.push_back(kSeparator);
    frame.append(json);
    frame.push_back(kEndOfMessage);
    return frame;
}

bool is_valid_operation_id(const std::string_view operation_id)
{
    return operation_id.find(kSeparator) == std::string_view::npos && operation_id.find(kEndOfMessage) == std::string_view::npos;
}

bool is_supported_protocol_version(const std::string_view version) { return version == kProtocolVersion1_0; }

std::string printable_frame(const std::string_view frame)
{
    std::string out;
    out.reserve(frame.size());
    for (const char c : frame)
    {
        if (c == kSeparator)
        {
            out.append("\\x1f");
        }
        else if (c == kEndOfMessage)
        {
            out.append("\\x00");
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

}    // namespace tcpengine::protocol
