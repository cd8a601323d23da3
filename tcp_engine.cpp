#include <mutex>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <expected>
#include <exception>
#include <string_view>

#include <boost/asio.hpp>

#include "log.h"
#include "tcp_engine.h"
#include "stop_dispatch.h"
#include "engine_errors.h"
#include "engine_protocol.h"

namespace tcpengine
{

namespace
{

[[nodiscard]] std::string resolve_engine_id(const std::string& configured, const std::string& role)
{
    if (!configured.empty())
    {
        return configured;
    }
    LOG_WARN("{} engine id is empty using role name", role);
    return role;
}

}    // namespace

tcp_engine::tcp_engine(
    boost::asio::io_context& io_context, std::string role, std::string peer_role, const config::engine_t& options, diagnostic_sink sink)
    : io_context_(io_context),
      strand_(boost::asio::make_strand(io_context)),
      options_(options),
      role_(std::move(role)),
      peer_role_(std::move(peer_role)),
      engine_id_(resolve_engine_id(options.id, role_)),
      display_name_(role_ + "(" + engine_id_ + ")"),
      ctx_(role_, engine_id_),
      sink_(std::move(sink)),
      disposal_(std::chrono::milliseconds(options.close_timeout_ms))
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    set_state(engine_state::kInitialized);
}

tcp_engine::~tcp_engine() { dispose_on_destruction(); }

void tcp_engine::add_command_handler(std::string tag, command_handler handler)
{
    handlers_.push_back(command_binding{.tag = std::move(tag), .handler = std::move(handler)});
}

void tcp_engine::process_request(const std::string_view frame)
{
    const auto parts = protocol::split_on_separator(frame);
    for (const auto& binding : handlers_)
    {
        if (binding.tag != parts.head)
        {
            continue;
        }

        LOG_CTX_TRACE(ctx_, "{} command {} payload {}", log_event::kDispatch, binding.tag, parts.tail.has_value() ? parts.tail->size() : 0);
        try
        {
            if (const auto ec = binding.handler(parts.tail); ec)
            {
                diagnose(diagnostic_level::kError,
                         "{}: error processing request '{}': {}",
                         display_name_,
                         protocol::printable_frame(frame),
                         ec.message());
            }
        }
        catch (const std::exception& ex)
        {
            diagnose(diagnostic_level::kError, "{}: error processing request '{}': {}", display_name_, protocol::printable_frame(frame), ex.what());
        }
        catch (...)
        {
            diagnose(diagnostic_level::kError, "{}: error processing request '{}': unknown exception", display_name_, protocol::printable_frame(frame));
        }
        return;
    }

    diagnose(diagnostic_level::kError, "{}: received unknown command '{}'", display_name_, protocol::printable_frame(frame));
}

void tcp_engine::set_state(const engine_state new_state)
{
    const auto old_state = state_.load(std::memory_order_relaxed);
    diagnose(diagnostic_level::kInfo, "{}: engine state transition from {} to {}", display_name_, to_string(old_state), to_string(new_state));
    state_.store(new_state, std::memory_order_release);
}

boost::system::error_code tcp_engine::dispose()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_disposing(state_.load(std::memory_order_relaxed)))
        {
            return engine_errc::kAlreadyDisposed;
        }
        set_state(engine_state::kDisconnecting);
    }

    LOG_CTX_INFO(ctx_, "{} releasing {} resources uptime {:.3f}s", log_event::kDispose, disposal_.size(), ctx_.uptime_seconds());
    const auto failures = disposal_.dispose();
    if (!failures)
    {
        diagnose(diagnostic_level::kError, "{}: cleanup did not run: {}", display_name_, failures.error().message());
    }
    else
    {
        for (const auto& failure : *failures)
        {
            diagnose(diagnostic_level::kError, "{}: cleanup of {} failed: {}", display_name_, failure.name, failure.reason);
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        set_state(engine_state::kDisconnected);
    }
    return {};
}

void tcp_engine::dispose_on_destruction()
{
    if (is_disposing(state()))
    {
        return;
    }
    if (const auto ec = dispose(); ec && ec != engine_errc::kAlreadyDisposed)
    {
        LOG_CTX_WARN(ctx_, "{} dispose on destruction failed {}", log_event::kDispose, ec.message());
    }
}

std::expected<std::shared_ptr<buffered_tcp_client>, boost::system::error_code> tcp_engine::attach_connection(const std::shared_ptr<tcp::socket>& socket)
{
    boost::system::error_code ec;
    const auto local = socket->local_endpoint(ec);
    if (!ec)
    {
        ctx_.local_port(local.port());
    }
    const auto remote = socket->remote_endpoint(ec);
    if (!ec)
    {
        ctx_.remote_port(remote.port());
    }

    const auto close_attached_socket = [this, socket]() -> boost::system::error_code
    {
        if (client_closes_socket_.load(std::memory_order_acquire))
        {
            return {};
        }
        return close_socket(socket);
    };
    if (const auto reg_ec = disposal_.add_action("socket", close_attached_socket); reg_ec)
    {
        return std::unexpected(reg_ec);
    }

    auto new_client = std::make_shared<buffered_tcp_client>(ctx_, strand_, socket, static_cast<std::size_t>(options_.max_frame_size));
    const std::weak_ptr<tcp_engine> weak_self = weak_from_this();
    new_client->set_frame_handler(
        [weak_self](const std::string_view frame)
        {
            if (const auto self = weak_self.lock())
            {
                self->process_request(frame);
            }
        });
    new_client->set_abnormal_termination_handler(
        [weak_self](const boost::system::error_code& term_ec)
        {
            if (const auto self = weak_self.lock())
            {
                self->on_abnormal_termination(term_ec);
            }
        });

    const auto reg_ec = disposal_.add_async_action("client",
                                                   [this, new_client]() -> std::future<boost::system::error_code>
                                                   {
                                                       before_client_close(*new_client);
                                                       if (strand_.running_in_this_thread())
                                                       {
                                                           // Disposed from inside one of our own handlers. Nothing posted to the
                                                           // strand runs before we return, so the client finishes the flush and
                                                           // closes the socket after us.
                                                           client_closes_socket_.store(true, std::memory_order_release);
                                                           new_client->close_when_flushed();
                                                           return {};
                                                       }
                                                       return new_client->async_close();
                                                   });
    if (reg_ec)
    {
        return std::unexpected(reg_ec);
    }

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        client_ = new_client;
    }
    LOG_CTX_INFO(ctx_, "{} attached {}", log_event::kConnect, ctx_.connection_info());
    return new_client;
}

std::shared_ptr<buffered_tcp_client> tcp_engine::client() const
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    return client_;
}

bool tcp_engine::send_frame(const std::string_view operation, std::string frame)
{
    if (is_disposing(state()))
    {
        diagnose(diagnostic_level::kWarning, "{}: {} called after the engine was disposed", display_name_, operation);
        return false;
    }
    const auto current = client();
    if (current == nullptr)
    {
        diagnose(diagnostic_level::kWarning, "{}: {} called when there is no connected {}", display_name_, operation, peer_role_);
        return false;
    }
    current->send(std::move(frame));
    return true;
}

boost::system::error_code tcp_engine::close_socket(const std::shared_ptr<tcp::socket>& socket)
{
    return detail::dispatch_cleanup_or_run_inline(
        io_context_,
        strand_,
        [this, socket]() -> boost::system::error_code
        {
            if (!socket->is_open())
            {
                return {};
            }
            boost::system::error_code ec;
            socket->shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != boost::asio::error::not_connected)
            {
                LOG_CTX_DEBUG(ctx_, "{} socket shutdown failed {}", log_event::kDispose, ec.message());
            }
            socket->close(ec);
            return ec;
        },
        detail::dispatch_timeout_policy::kRunInline,
        std::chrono::milliseconds(options_.cleanup_dispatch_timeout_ms));
}

void tcp_engine::emit_diagnostic(const diagnostic_level level, std::string text)
{
    switch (level)
    {
        case diagnostic_level::kInfo:
            LOG_CTX_INFO(ctx_, "{} {}", log_event::kDiagnostic, text);
            break;
        case diagnostic_level::kWarning:
            LOG_CTX_WARN(ctx_, "{} {}", log_event::kDiagnostic, text);
            break;
        case diagnostic_level::kError:
            LOG_CTX_ERROR(ctx_, "{} {}", log_event::kDiagnostic, text);
            break;
    }

    if (!sink_)
    {
        return;
    }
    try
    {
        sink_(diagnostic_message{.level = level, .text = std::move(text)});
    }
    catch (const std::exception& ex)
    {
        LOG_CTX_WARN(ctx_, "{} diagnostic sink failed {}", log_event::kDiagnostic, ex.what());
    }
    catch (...)
    {
        LOG_CTX_WARN(ctx_, "{} diagnostic sink failed unknown exception", log_event::kDiagnostic);
    }
}

}    // namespace tcpengine
