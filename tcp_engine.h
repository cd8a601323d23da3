#ifndef TCP_ENGINE_H
#define TCP_ENGINE_H

#include <mutex>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <expected>
#include <optional>
#include <exception>
#include <functional>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/format.h>

#include "log.h"
#include "config.h"
#include "diagnostics.h"
#include "log_context.h"
#include "engine_state.h"
#include "disposal_tracker.h"
#include "buffered_tcp_client.h"

namespace tcpengine
{

// Shared machinery of both connection roles: identity, the state machine, the
// command registry and teardown. Derived engines are created with std::make_shared.
class tcp_engine : public std::enable_shared_from_this<tcp_engine>
{
   public:
    // Gets the bytes after the first separator, or nullopt when the frame had none.
    using command_handler = std::function<boost::system::error_code(std::optional<std::string_view> payload)>;

    virtual ~tcp_engine();

    tcp_engine(const tcp_engine&) = delete;
    tcp_engine& operator=(const tcp_engine&) = delete;

    // Advisory snapshot. Decisions that depend on the state are made under state_mutex().
    [[nodiscard]] engine_state state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const std::string& engine_id() const { return engine_id_; }
    [[nodiscard]] const std::string& display_name() const { return display_name_; }

    // Splits the frame at the first separator and runs the first handler registered for its tag.
    void process_request(std::string_view frame);

    // Idempotent. Runs every registered cleanup action in reverse order and ends in kDisconnected.
    // When called on the strand, for instance because the last owner was dropped inside a
    // dispatcher callback, the client flush and socket close complete after that callback returns.
    [[nodiscard]] boost::system::error_code dispose();

   protected:
    tcp_engine(boost::asio::io_context& io_context, std::string role, std::string peer_role, const config::engine_t& options, diagnostic_sink sink);

    void add_command_handler(std::string tag, command_handler handler);

    // Caller holds state_mutex().
    void set_state(engine_state new_state);
    [[nodiscard]] std::mutex& state_mutex() const { return state_mutex_; }

    [[nodiscard]] disposal_tracker& disposal() { return disposal_; }
    [[nodiscard]] boost::asio::io_context& io() { return io_context_; }
    [[nodiscard]] io_strand& strand() { return strand_; }
    [[nodiscard]] engine_context& context() { return ctx_; }
    [[nodiscard]] const config::engine_t& options() const { return options_; }

    // Caller holds state_mutex(). Registers the socket and client teardown and publishes the
    // client. Once started, frames go to process_request on the strand.
    [[nodiscard]] std::expected<std::shared_ptr<buffered_tcp_client>, boost::system::error_code> attach_connection(
        const std::shared_ptr<tcp::socket>& socket);

    [[nodiscard]] std::shared_ptr<buffered_tcp_client> client() const;

    // Sends one encoded frame, or diagnoses and drops it when no peer is attached or the
    // engine is being disposed.
    bool send_frame(std::string_view operation, std::string frame);

    // Closes a socket on the strand, shutting it down first when connected.
    [[nodiscard]] boost::system::error_code close_socket(const std::shared_ptr<tcp::socket>& socket);

    // Runs on the disposing thread before the client is flushed and closed.
    virtual void before_client_close(buffered_tcp_client& client) { (void)client; }
    // Runs on the strand when the read side fails for any reason but EOF or close.
    virtual void on_abnormal_termination(const boost::system::error_code& ec) { (void)ec; }

    // Derived destructors call this first so teardown still sees the derived members.
    void dispose_on_destruction();

    template <typename... Args>
    void diagnose(const diagnostic_level level, fmt::format_string<Args...> format_str, Args&&... args)
    {
        emit_diagnostic(level, fmt::format(format_str, std::forward<Args>(args)...));
    }

   private:
    void emit_diagnostic(diagnostic_level level, std::string text);

   private:
    struct command_binding
    {
        std::string tag;
        command_handler handler;
    };

    boost::asio::io_context& io_context_;
    io_strand strand_;
    config::engine_t options_;
    std::string role_;
    std::string peer_role_;
    std::string engine_id_;
    std::string display_name_;
    engine_context ctx_;
    diagnostic_sink sink_;

    std::vector<command_binding> handlers_;

    mutable std::mutex state_mutex_;
    std::atomic<engine_state> state_{engine_state::kUnknown};
    disposal_tracker disposal_;

    mutable std::mutex client_mutex_;
    std::shared_ptr<buffered_tcp_client> client_;
    std::atomic<bool> client_closes_socket_{false};
};

}    // namespace tcpengine

#endif
