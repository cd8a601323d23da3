#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <cstdint>
#include <optional>
#include <expected>

namespace tcpengine
{

struct config
{
    struct log_t
    {
        std::string level = "info";
        std::string file = "tcpengine.log";
    } log;

    struct engine_t
    {
        std::string id = "default";
        std::uint64_t max_frame_size = 16UL * 1024 * 1024;
        std::uint32_t close_timeout_ms = 5000;
        std::uint32_t cleanup_dispatch_timeout_ms = 1000;
    } engine;

    struct execution_t
    {
        std::string test_assembly_unique_id;
        std::string test_framework_display_name;
    } execution;
};

struct config_error
{
    std::string path = "/";
    std::string reason;
};

constexpr std::uint64_t kMinFrameSize = 64;
constexpr std::uint64_t kMaxFrameSizeLimit = 256UL * 1024 * 1024;

[[nodiscard]] std::expected<config, config_error> parse_config_with_error(const std::string& filename);
[[nodiscard]] std::optional<config> parse_config(const std::string& filename);
[[nodiscard]] std::expected<config, config_error> deserialize_config_with_error(const std::string& text);
[[nodiscard]] std::string dump_config(const config& cfg);
[[nodiscard]] std::string dump_default_config();

}    // namespace tcpengine

#endif
