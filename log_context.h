#ifndef LOG_CONTEXT_H
#define LOG_CONTEXT_H

#include <string>
#include <cstdint>
#include <chrono>
#include <utility>
#include <string_view>

namespace tcpengine
{

namespace log_event
{
constexpr std::string_view kState = "state";
constexpr std::string_view kListen = "listen";
constexpr std::string_view kAccept = "accept";
constexpr std::string_view kConnect = "connect";
constexpr std::string_view kHandshake = "handshake";
constexpr std::string_view kDispatch = "dispatch";
constexpr std::string_view kSend = "send";
constexpr std::string_view kRecv = "recv";
constexpr std::string_view kCancel = "cancel";
constexpr std::string_view kDispose = "dispose";
constexpr std::string_view kDiagnostic = "diag";
}    // namespace log_event

[[nodiscard]] std::string generate_trace_id();

class engine_context
{
   public:
    engine_context() = default;
    engine_context(std::string role, std::string engine_id);

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    [[nodiscard]] const std::string& role() const { return role_; }
    [[nodiscard]] const std::string& engine_id() const { return engine_id_; }
    [[nodiscard]] std::uint16_t local_port() const { return local_port_; }
    [[nodiscard]] std::uint16_t remote_port() const { return remote_port_; }

    void trace_id(std::string value) { trace_id_ = std::move(value); }
    void local_port(const std::uint16_t value) { local_port_ = value; }
    void remote_port(const std::uint16_t value) { remote_port_ = value; }
    void new_trace_id() { trace_id_ = generate_trace_id(); }

    [[nodiscard]] std::string prefix() const;
    [[nodiscard]] std::string connection_info() const;
    [[nodiscard]] double uptime_seconds() const;

   private:
    std::string trace_id_;
    std::string role_;
    std::string engine_id_;
    std::uint16_t local_port_ = 0;
    std::uint16_t remote_port_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

}    // namespace tcpengine

#endif
