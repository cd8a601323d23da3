#include <chrono>
#include <random>
#include <string>
#include <cstdint>
#include <charconv>
#include <utility>
#include <system_error>

#include "log_context.h"

namespace tcpengine
{
namespace
{

template <typename IntT>
void append_int(std::string& out, const IntT value)
{
    char buf[32];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc())
    {
        out.append(buf, ptr);
    }
}

std::string fixed_hex_16(std::uint64_t value)
{
    char buf[16];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, 16);
    if (ec != std::errc())
    {
        return "0000000000000000";
    }

    const auto len = static_cast<std::size_t>(ptr - buf);
    std::string out;
    out.reserve(16);
    out.append(16 - len, '0');
    out.append(buf, len);
    return out;
}

}    // namespace

std::string generate_trace_id()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    return fixed_hex_16(dist(gen));
}

engine_context::engine_context(std::string role, std::string engine_id) : role_(std::move(role)), engine_id_(std::move(engine_id))
{
    new_trace_id();
}

std::string engine_context::prefix() const
{
    std::string out;
    out.reserve(trace_id_.size() + role_.size() + engine_id_.size() + 8);
    if (!trace_id_.empty())
    {
        out.push_back('t');
        out += trace_id_;
        out.push_back(' ');
    }
    out += role_;
    out.push_back(':');
    out += engine_id_;
    return out;
}

std::string engine_context::connection_info() const
{
    std::string out;
    out.reserve(48);
    out += "127.0.0.1_";
    append_int(out, local_port_);
    out += "_127.0.0.1_";
    append_int(out, remote_port_);
    return out;
}

double engine_context::uptime_seconds() const
{
    const auto now = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    return static_cast<double>(duration.count()) / 1000.0;
}

}    // namespace tcpengine
