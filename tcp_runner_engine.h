#ifndef TCP_RUNNER_ENGINE_H
#define TCP_RUNNER_ENGINE_H

#include <atomic>
#include <memory>
#include <string>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "config.h"
#include "tcp_engine.h"
#include "engine_info.h"
#include "diagnostics.h"
#include "engine_message.h"

namespace tcpengine
{

// Runner side of the connection. Listens on a loopback port, accepts exactly one
// execution engine, negotiates INFO and then drives it with FIND/RUN/CANCEL/QUIT
// while forwarding its MSG notifications to the dispatcher.
class tcp_runner_engine : public tcp_engine
{
   public:
    tcp_runner_engine(boost::asio::io_context& io_context, const config::engine_t& options, message_dispatcher dispatcher, diagnostic_sink sink = nullptr);
    ~tcp_runner_engine() override;

    // Binds 127.0.0.1 on an ephemeral port and begins accepting. Returns the port.
    [[nodiscard]] std::expected<std::uint16_t, boost::system::error_code> start();

    [[nodiscard]] boost::system::error_code send_find(std::string_view operation_id);
    [[nodiscard]] boost::system::error_code send_run(std::string_view operation_id);
    [[nodiscard]] boost::system::error_code send_cancel(std::string_view operation_id);
    void send_quit();

    // engine_errc::kInvalidState until the execution engine has been negotiated, or
    // when its INFO did not carry the field.
    [[nodiscard]] std::expected<std::string, boost::system::error_code> test_assembly_unique_id() const;
    [[nodiscard]] std::expected<std::string, boost::system::error_code> test_framework_display_name() const;
    [[nodiscard]] std::optional<execution_engine_info> negotiated_info() const;

    [[nodiscard]] const runner_engine_info& info() const { return info_; }
    [[nodiscard]] std::uint16_t port() const { return port_.load(std::memory_order_acquire); }
    [[nodiscard]] bool quit_sent() const { return quit_sent_.load(std::memory_order_acquire); }
    [[nodiscard]] bool cancel_requested() const { return cancel_requested_.load(std::memory_order_acquire); }

   protected:
    void before_client_close(buffered_tcp_client& client) override;
    void on_abnormal_termination(const boost::system::error_code& ec) override;

   private:
    void on_accept(const boost::system::error_code& ec, tcp::socket socket);
    [[nodiscard]] boost::system::error_code on_info(std::optional<std::string_view> payload);
    [[nodiscard]] boost::system::error_code on_message(std::optional<std::string_view> payload);
    [[nodiscard]] boost::system::error_code send_operation(std::string_view command, std::string_view operation_id);
    [[nodiscard]] boost::system::error_code close_acceptor(const std::shared_ptr<tcp::acceptor>& acceptor);

   private:
    message_dispatcher dispatcher_;
    runner_engine_info info_;
    std::atomic<std::uint16_t> port_{0};
    // guarded by state_mutex()
    std::optional<execution_engine_info> negotiated_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> quit_sent_{false};
};

}    // namespace tcpengine

#endif
