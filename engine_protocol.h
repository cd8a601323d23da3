#ifndef ENGINE_PROTOCOL_H
#define ENGINE_PROTOCOL_H

#include <string>
#include <cstddef>
#include <optional>
#include <string_view>

namespace tcpengine::protocol
{

constexpr char kSeparator = '\x1f';
constexpr char kEndOfMessage = '\0';

// sent by both roles
constexpr std::string_view kCmdInfo = "INFO";

// execution engine -> runner
constexpr std::string_view kCmdMessage = "MSG";

// runner -> execution engine
constexpr std::string_view kCmdFind = "FIND";
constexpr std::string_view kCmdRun = "RUN";
constexpr std::string_view kCmdCancel = "CANCEL";
constexpr std::string_view kCmdQuit = "QUIT";

constexpr std::string_view kProtocolVersion1_0 = "1.0";

// operation id used for messages that are not tied to a single request
constexpr std::string_view kBroadcastOperationId = "::BROADCAST::";

constexpr std::size_t kDefaultMaxFrameSize = 16UL * 1024 * 1024;

struct split_result
{
    std::string_view head;
    std::optional<std::string_view> tail;
};

[[nodiscard]] split_result split_on_separator(std::string_view data);

[[nodiscard]] std::string encode_frame(std::string_view command);
[[nodiscard]] std::string encode_frame(std::string_view command, std::string_view payload);
[[nodiscard]] std::string encode_message_frame(std::string_view operation_id, std::string_view json);

[[nodiscard]] bool is_valid_operation_id(std::string_view operation_id);
[[nodiscard]] bool is_supported_protocol_version(std::string_view version);

// renders control bytes visibly for diagnostics
[[nodiscard]] std::string printable_frame(std::string_view frame);

}    // namespace tcpengine::protocol

#endif
