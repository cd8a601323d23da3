#include <mutex>
#include <memory>
#include <string>
#include <utility>
#include <expected>
#include <optional>
#include <exception>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "stop_dispatch.h"
#include "engine_errors.h"
#include "engine_protocol.h"
#include "tcp_runner_engine.h"

namespace tcpengine
{

tcp_runner_engine::tcp_runner_engine(boost::asio::io_context& io_context,
                                     const config::engine_t& options,
                                     message_dispatcher dispatcher,
                                     diagnostic_sink sink)
    : tcp_engine(io_context, "runner", "execution engine", options, std::move(sink)), dispatcher_(std::move(dispatcher))
{
    add_command_handler(std::string(protocol::kCmdInfo), [this](const std::optional<std::string_view> payload) { return on_info(payload); });
    add_command_handler(std::string(protocol::kCmdMessage), [this](const std::optional<std::string_view> payload) { return on_message(payload); });
}

tcp_runner_engine::~tcp_runner_engine() { dispose_on_destruction(); }

std::expected<std::uint16_t, boost::system::error_code> tcp_runner_engine::start()
{
    const auto owner = weak_from_this().lock();
    if (owner == nullptr)
    {
        diagnose(diagnostic_level::kError, "{}: start requires the engine to be owned by a shared_ptr", display_name());
        return std::unexpected(make_error_code(engine_errc::kInvalidState));
    }
    const std::weak_ptr<tcp_runner_engine> weak_self = std::static_pointer_cast<tcp_runner_engine>(owner);

    std::lock_guard<std::mutex> lock(state_mutex());
    if (state() != engine_state::kInitialized)
    {
        diagnose(diagnostic_level::kError, "{}: start called in state {}", display_name(), to_string(state()));
        return std::unexpected(make_error_code(engine_errc::kInvalidState));
    }

    auto acceptor = std::make_shared<tcp::acceptor>(strand());
    const tcp::endpoint endpoint(boost::asio::ip::address_v4::loopback(), 0);
    boost::system::error_code ec;
    acceptor->open(endpoint.protocol(), ec);
    if (!ec)
    {
        acceptor->bind(endpoint, ec);
    }
    if (!ec)
    {
        acceptor->listen(1, ec);
    }
    tcp::endpoint local;
    if (!ec)
    {
        local = acceptor->local_endpoint(ec);
    }
    if (ec)
    {
        diagnose(diagnostic_level::kError, "{}: listen on loopback failed: {}", display_name(), ec.message());
        boost::system::error_code close_ec;
        acceptor->close(close_ec);
        return std::unexpected(ec);
    }

    if (const auto reg_ec = disposal().add_action("listener", [this, acceptor]() { return close_acceptor(acceptor); }); reg_ec)
    {
        boost::system::error_code close_ec;
        acceptor->close(close_ec);
        return std::unexpected(reg_ec);
    }

    port_.store(local.port(), std::memory_order_release);
    context().local_port(local.port());
    set_state(engine_state::kListening);
    diagnose(diagnostic_level::kInfo, "Listening on tcp://localhost:{}/", local.port());

    acceptor->async_accept(
        [weak_self](const boost::system::error_code& accept_ec, tcp::socket socket)
        {
            if (const auto self = weak_self.lock())
            {
                self->on_accept(accept_ec, std::move(socket));
            }
        });
    return local.port();
}

void tcp_runner_engine::on_accept(const boost::system::error_code& ec, tcp::socket socket)
{
    if (ec)
    {
        if (ec == boost::asio::error::operation_aborted)
        {
            LOG_CTX_DEBUG(context(), "{} accept aborted", log_event::kAccept);
            return;
        }
        diagnose(diagnostic_level::kError, "{}: accept failed: {}", display_name(), ec.message());
        return;
    }

    std::lock_guard<std::mutex> lock(state_mutex());
    if (is_disposing(state()))
    {
        boost::system::error_code close_ec;
        socket.close(close_ec);
        diagnose(diagnostic_level::kWarning, "{}: closed connection accepted during disposal", display_name());
        return;
    }

    auto shared_socket = std::make_shared<tcp::socket>(std::move(socket));
    boost::system::error_code ep_ec;
    const auto remote = shared_socket->remote_endpoint(ep_ec);
    diagnose(diagnostic_level::kInfo, "{}: accepted execution engine connection on remote port {}", display_name(), ep_ec ? 0 : remote.port());

    const auto attached = attach_connection(shared_socket);
    if (!attached)
    {
        diagnose(diagnostic_level::kError, "{}: failed to attach connection: {}", display_name(), attached.error().message());
        boost::system::error_code close_ec;
        shared_socket->close(close_ec);
        return;
    }

    set_state(engine_state::kNegotiating);
    (*attached)->start();
    (*attached)->send(protocol::encode_frame(protocol::kCmdInfo, serialize_engine_info(info_)));
}

boost::system::error_code tcp_runner_engine::on_info(const std::optional<std::string_view> payload)
{
    if (!payload.has_value())
    {
        diagnose(diagnostic_level::kError, "{}: INFO data is missing the JSON", display_name());
        return {};
    }

    auto decoded = deserialize_execution_engine_info(*payload);
    if (!decoded)
    {
        return decoded.error();
    }
    if (!protocol::is_supported_protocol_version(decoded->protocol_version()))
    {
        diagnose(diagnostic_level::kWarning, "{}: execution engine reports unrecognized protocol version '{}'", display_name(), decoded->protocol_version());
    }

    std::lock_guard<std::mutex> lock(state_mutex());
    if (state() != engine_state::kNegotiating)
    {
        diagnose(diagnostic_level::kError, "{}: received INFO while {}, ignoring it", display_name(), to_string(state()));
        return {};
    }

    negotiated_ = std::move(*decoded);
    diagnose(diagnostic_level::kInfo,
             "{}: negotiated with {} for {}",
             display_name(),
             negotiated_->test_framework_display_name().value_or("<unset framework>"),
             negotiated_->test_assembly_unique_id().value_or("<unset assembly>"));
    set_state(engine_state::kConnected);
    return {};
}

boost::system::error_code tcp_runner_engine::on_message(const std::optional<std::string_view> payload)
{
    if (!payload.has_value())
    {
        diagnose(diagnostic_level::kError, "{}: MSG data is missing the operation ID and JSON", display_name());
        return {};
    }

    const auto parts = protocol::split_on_separator(*payload);
    if (!parts.tail.has_value())
    {
        diagnose(diagnostic_level::kError, "{}: MSG data is missing the JSON", display_name());
        return {};
    }

    const auto message = parse_engine_message(*parts.tail);
    if (!message)
    {
        return message.error();
    }

    const std::string operation_id(parts.head);
    LOG_CTX_DEBUG(context(), "{} operation {} message type '{}'", log_event::kDispatch, operation_id, message->type);
    if (!dispatcher_)
    {
        return {};
    }
    if (dispatcher_(operation_id, *message))
    {
        return {};
    }

    if (cancel_requested_.exchange(true, std::memory_order_acq_rel))
    {
        return {};
    }
    LOG_CTX_INFO(context(), "{} dispatcher stopped operation {}", log_event::kCancel, operation_id);
    send_frame(protocol::kCmdCancel, protocol::encode_frame(protocol::kCmdCancel));
    return {};
}

void tcp_runner_engine::on_abnormal_termination(const boost::system::error_code& ec)
{
    diagnose(diagnostic_level::kError, "{}: connection terminated abnormally: {}", display_name(), ec.message());
    if (!dispatcher_)
    {
        return;
    }
    try
    {
        (void)dispatcher_(std::string(protocol::kBroadcastOperationId), make_error_message(ec));
    }
    catch (const std::exception& ex)
    {
        diagnose(diagnostic_level::kError, "{}: dispatcher failed on termination message: {}", display_name(), ex.what());
    }
    catch (...)
    {
        diagnose(diagnostic_level::kError, "{}: dispatcher failed on termination message: unknown exception", display_name());
    }
}

void tcp_runner_engine::before_client_close(buffered_tcp_client& client)
{
    if (quit_sent_.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    LOG_CTX_INFO(context(), "{} sending QUIT before close", log_event::kDispose);
    client.send(protocol::encode_frame(protocol::kCmdQuit));
}

boost::system::error_code tcp_runner_engine::send_operation(const std::string_view command, const std::string_view operation_id)
{
    if (!protocol::is_valid_operation_id(operation_id))
    {
        diagnose(diagnostic_level::kError, "{}: {} rejected operation id '{}'", display_name(), command, protocol::printable_frame(operation_id));
        return boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
    }
    if (send_frame(command, protocol::encode_frame(command, operation_id)))
    {
        diagnose(diagnostic_level::kInfo, "Request sent: {} {}", command, operation_id);
    }
    return {};
}

boost::system::error_code tcp_runner_engine::send_find(const std::string_view operation_id) { return send_operation(protocol::kCmdFind, operation_id); }

boost::system::error_code tcp_runner_engine::send_run(const std::string_view operation_id) { return send_operation(protocol::kCmdRun, operation_id); }

boost::system::error_code tcp_runner_engine::send_cancel(const std::string_view operation_id) { return send_operation(protocol::kCmdCancel, operation_id); }

void tcp_runner_engine::send_quit()
{
    // dispose() moves to kDisconnecting under the same lock, so QUIT is either queued here
    // ahead of the close or left for before_client_close to send.
    std::lock_guard<std::mutex> lock(state_mutex());
    if (is_disposing(state()) || client() == nullptr)
    {
        (void)send_frame(protocol::kCmdQuit, protocol::encode_frame(protocol::kCmdQuit));
        return;
    }
    if (quit_sent_.exchange(true, std::memory_order_acq_rel))
    {
        LOG_CTX_DEBUG(context(), "{} QUIT already sent", log_event::kSend);
        return;
    }
    if (send_frame(protocol::kCmdQuit, protocol::encode_frame(protocol::kCmdQuit)))
    {
        diagnose(diagnostic_level::kInfo, "Request sent: {}", protocol::kCmdQuit);
    }
}

std::expected<std::string, boost::system::error_code> tcp_runner_engine::test_assembly_unique_id() const
{
    std::lock_guard<std::mutex> lock(state_mutex());
    if (!negotiated_.has_value())
    {
        return std::unexpected(make_error_code(engine_errc::kInvalidState));
    }
    auto value = negotiated_->test_assembly_unique_id();
    if (!value)
    {
        return std::unexpected(make_error_code(engine_errc::kInvalidState));
    }
    return value;
}

std::expected<std::string, boost::system::error_code> tcp_runner_engine::test_framework_display_name() const
{
    std::lock_guard<std::mutex> lock(state_mutex());
    if (!negotiated_.has_value())
    {
        return std::unexpected(make_error_code(engine_errc::kInvalidState));
    }
    auto value = negotiated_->test_framework_display_name();
    if (!value)
    {
        return std::unexpected(make_error_code(engine_errc::kInvalidState));
    }
    return value;
}

std::optional<execution_engine_info> tcp_runner_engine::negotiated_info() const
{
    std::lock_guard<std::mutex> lock(state_mutex());
    return negotiated_;
}

boost::system::error_code tcp_runner_engine::close_acceptor(const std::shared_ptr<tcp::acceptor>& acceptor)
{
    return detail::dispatch_cleanup_or_run_inline(
        io(),
        strand(),
        [acceptor]() -> boost::system::error_code
        {
            if (!acceptor->is_open())
            {
                return {};
            }
            boost::system::error_code ec;
            acceptor->close(ec);
            return ec;
        },
        detail::dispatch_timeout_policy::kRunInline,
        std::chrono::milliseconds(options().cleanup_dispatch_timeout_ms));
}

}    // namespace tcpengine
