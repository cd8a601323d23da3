#include <mutex>
#include <memory>
#include <string>
#include <utility>
#include <optional>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "engine_errors.h"
#include "engine_protocol.h"
#include "tcp_execution_engine.h"

namespace tcpengine
{

tcp_execution_engine::tcp_execution_engine(boost::asio::io_context& io_context,
                                           const config::engine_t& options,
                                           execution_engine_info info,
                                           execution_engine_handlers handlers,
                                           diagnostic_sink sink)
    : tcp_engine(io_context, "execution", "runner", options, std::move(sink)), info_(std::move(info)), callbacks_(std::move(handlers))
{
    if (!info_.has_test_assembly_unique_id() || !info_.has_test_framework_display_name())
    {
        LOG_CTX_WARN(context(), "{} engine info is incomplete, start will be refused", log_event::kHandshake);
    }

    add_command_handler(std::string(protocol::kCmdInfo), [this](const std::optional<std::string_view> payload) { return on_info(payload); });
    add_command_handler(std::string(protocol::kCmdFind),
                        [this](const std::optional<std::string_view> payload) { return on_operation(protocol::kCmdFind, payload, callbacks_.on_find); });
    add_command_handler(std::string(protocol::kCmdRun),
                        [this](const std::optional<std::string_view> payload) { return on_operation(protocol::kCmdRun, payload, callbacks_.on_run); });
    // a bare CANCEL stops whatever is running and reaches on_cancel with an empty id
    add_command_handler(std::string(protocol::kCmdCancel),
                        [this](const std::optional<std::string_view> payload)
                        { return on_operation(protocol::kCmdCancel, payload.value_or(std::string_view{}), callbacks_.on_cancel); });
    add_command_handler(std::string(protocol::kCmdQuit), [this](const std::optional<std::string_view> payload) { return on_quit(payload); });
}

tcp_execution_engine::~tcp_execution_engine() { dispose_on_destruction(); }

boost::system::error_code tcp_execution_engine::start(const std::uint16_t port)
{
    if (!info_.has_test_assembly_unique_id() || !info_.has_test_framework_display_name())
    {
        diagnose(diagnostic_level::kError, "{}: cannot start without a test assembly id and framework name", display_name());
        return boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
    }
    if (weak_from_this().expired())
    {
        diagnose(diagnostic_level::kError, "{}: start requires the engine to be owned by a shared_ptr", display_name());
        return engine_errc::kInvalidState;
    }

    std::lock_guard<std::mutex> lock(state_mutex());
    if (state() != engine_state::kInitialized)
    {
        diagnose(diagnostic_level::kError, "{}: start called in state {}", display_name(), to_string(state()));
        return engine_errc::kInvalidState;
    }

    auto socket = std::make_shared<tcp::socket>(strand());
    const tcp::endpoint endpoint(boost::asio::ip::address_v4::loopback(), port);
    boost::system::error_code ec;
    socket->connect(endpoint, ec);
    if (ec)
    {
        diagnose(diagnostic_level::kError, "{}: connect to runner port {} failed: {}", display_name(), port, ec.message());
        boost::system::error_code close_ec;
        socket->close(close_ec);
        return ec;
    }
    diagnose(diagnostic_level::kInfo, "{}: connected to runner on port {}", display_name(), port);

    const auto attached = attach_connection(socket);
    if (!attached)
    {
        boost::system::error_code close_ec;
        socket->close(close_ec);
        return attached.error();
    }

    set_state(engine_state::kNegotiating);
    (*attached)->start();
    return {};
}

boost::system::error_code tcp_execution_engine::on_info(const std::optional<std::string_view> payload)
{
    if (!payload.has_value())
    {
        diagnose(diagnostic_level::kError, "{}: INFO data is missing the JSON", display_name());
        return {};
    }

    auto decoded = deserialize_runner_engine_info(*payload);
    if (!decoded)
    {
        return decoded.error();
    }
    if (!protocol::is_supported_protocol_version(decoded->protocol_version()))
    {
        diagnose(diagnostic_level::kWarning, "{}: runner reports unrecognized protocol version '{}'", display_name(), decoded->protocol_version());
    }

    std::lock_guard<std::mutex> lock(state_mutex());
    if (state() != engine_state::kNegotiating)
    {
        diagnose(diagnostic_level::kError, "{}: received INFO while {}, ignoring it", display_name(), to_string(state()));
        return {};
    }

    runner_info_ = std::move(*decoded);
    if (!send_frame(protocol::kCmdInfo, protocol::encode_frame(protocol::kCmdInfo, serialize_engine_info(info_))))
    {
        return engine_errc::kInvalidState;
    }
    set_state(engine_state::kConnected);
    return {};
}

boost::system::error_code tcp_execution_engine::on_operation(const std::string_view command,
                                                             const std::optional<std::string_view> payload,
                                                             const std::function<void(const std::string&)>& callback)
{
    if (!payload.has_value())
    {
        diagnose(diagnostic_level::kError, "{}: {} data is missing the operation ID", display_name(), command);
        return {};
    }
    if (state() != engine_state::kConnected)
    {
        diagnose(diagnostic_level::kError, "{}: received {} while {}, ignoring it", display_name(), command, to_string(state()));
        return {};
    }

    const std::string operation_id(*payload);
    LOG_CTX_INFO(context(), "{} {} {}", log_event::kDispatch, command, operation_id);
    if (callback)
    {
        callback(operation_id);
    }
    return {};
}

boost::system::error_code tcp_execution_engine::on_quit(const std::optional<std::string_view> payload)
{
    if (payload.has_value())
    {
        LOG_CTX_DEBUG(context(), "{} QUIT carried {} unexpected bytes", log_event::kDispatch, payload->size());
    }
    quit_requested_.store(true, std::memory_order_release);
    diagnose(diagnostic_level::kInfo, "{}: runner requested quit", display_name());
    if (callbacks_.on_quit)
    {
        callbacks_.on_quit();
    }
    return {};
}

boost::system::error_code tcp_execution_engine::send_message(const std::string_view operation_id, const std::string_view json)
{
    if (!protocol::is_valid_operation_id(operation_id) || json.find(protocol::kEndOfMessage) != std::string_view::npos)
    {
        diagnose(diagnostic_level::kError, "{}: MSG rejected for operation '{}'", display_name(), protocol::printable_frame(operation_id));
        return boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
    }
    (void)send_frame(protocol::kCmdMessage, protocol::encode_message_frame(operation_id, json));
    return {};
}

std::optional<runner_engine_info> tcp_execution_engine::runner_info() const
{
    std::lock_guard<std::mutex> lock(state_mutex());
    return runner_info_;
}

}    // namespace tcpengine
