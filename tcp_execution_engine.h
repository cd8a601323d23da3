#ifndef TCP_EXECUTION_ENGINE_H
#define TCP_EXECUTION_ENGINE_H

#include <atomic>
#include <string>
#include <cstdint>
#include <optional>
#include <functional>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "config.h"
#include "tcp_engine.h"
#include "engine_info.h"
#include "diagnostics.h"

namespace tcpengine
{

struct execution_engine_handlers
{
    std::function<void(const std::string& operation_id)> on_find;
    std::function<void(const std::string& operation_id)> on_run;
    std::function<void(const std::string& operation_id)> on_cancel;
    std::function<void()> on_quit;
};

// Execution side of the connection: dials the runner, answers its INFO and hands
// FIND/RUN/CANCEL/QUIT to the registered callbacks on the connection strand.
class tcp_execution_engine : public tcp_engine
{
   public:
    tcp_execution_engine(boost::asio::io_context& io_context,
                         const config::engine_t& options,
                         execution_engine_info info,
                         execution_engine_handlers handlers,
                         diagnostic_sink sink = nullptr);
    ~tcp_execution_engine() override;

    // Connects to 127.0.0.1:<port> and waits for the runner INFO.
    [[nodiscard]] boost::system::error_code start(std::uint16_t port);

    // Sends MSG <operation_id> <json>. The json is not inspected.
    [[nodiscard]] boost::system::error_code send_message(std::string_view operation_id, std::string_view json);

    [[nodiscard]] const execution_engine_info& info() const { return info_; }
    [[nodiscard]] std::optional<runner_engine_info> runner_info() const;
    [[nodiscard]] bool quit_requested() const { return quit_requested_.load(std::memory_order_acquire); }

   private:
    [[nodiscard]] boost::system::error_code on_info(std::optional<std::string_view> payload);
    [[nodiscard]] boost::system::error_code on_operation(std::string_view command,
                                                         std::optional<std::string_view> payload,
                                                         const std::function<void(const std::string&)>& callback);
    [[nodiscard]] boost::system::error_code on_quit(std::optional<std::string_view> payload);

   private:
    execution_engine_info info_;
    execution_engine_handlers callbacks_;
    // guarded by state_mutex()
    std::optional<runner_engine_info> runner_info_;
    std::atomic<bool> quit_requested_{false};
};

}    // namespace tcpengine

#endif
