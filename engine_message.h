#ifndef ENGINE_MESSAGE_H
#define ENGINE_MESSAGE_H

#include <string>
#include <expected>
#include <string_view>
#include <functional>

#include <boost/system/error_code.hpp>

namespace tcpengine
{

constexpr std::string_view kErrorMessageType = "error";

// Application message carried by a MSG frame. The json text is kept verbatim;
// type is the optional "type" member of the object.
struct engine_message
{
    std::string type;
    std::string json;
};

// Returns false to ask the runner to cancel the current operation.
using message_dispatcher = std::function<bool(const std::string& operation_id, const engine_message& message)>;

// errc::bad_message unless json is an object whose "type", when present, is a string.
[[nodiscard]] std::expected<engine_message, boost::system::error_code> parse_engine_message(std::string_view json);

[[nodiscard]] engine_message make_engine_message(std::string type);

// Message broadcast to the dispatcher when the connection terminates abnormally.
[[nodiscard]] engine_message make_error_message(const boost::system::error_code& ec);

}    // namespace tcpengine

#endif
