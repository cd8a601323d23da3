#include <cerrno>
#include <cstdio>
#include <string>
#include <cstdint>
#include <cstring>
#include <utility>
#include <expected>
#include <optional>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>

#include "log.h"
#include "config.h"
#include "reflect.h"

namespace reflect
{

template <typename Vis>
void reflect(Vis& vis, tcpengine::config::log_t& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(level);
    REFLECT_MEMBER(file);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, tcpengine::config::engine_t& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(id);
    REFLECT_MEMBER(max_frame_size);
    REFLECT_MEMBER(close_timeout_ms);
    REFLECT_MEMBER(cleanup_dispatch_timeout_ms);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, tcpengine::config::execution_t& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(test_assembly_unique_id);
    REFLECT_MEMBER(test_framework_display_name);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, tcpengine::config& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(log);
    REFLECT_MEMBER(engine);
    REFLECT_MEMBER(execution);
    reflectMemberEnd(vis);
}

}    // namespace reflect

namespace tcpengine
{

namespace
{

[[nodiscard]] config_error make_config_error(std::string path, std::string reason)
{
    config_error error;
    error.path = std::move(path);
    error.reason = std::move(reason);
    return error;
}

[[nodiscard]] std::expected<void, config_error> validate_log_config(const config::log_t& log)
{
    if (log.file.empty())
    {
        return std::unexpected(make_config_error("/log/file", "must be non-empty"));
    }
    if (!is_known_level(log.level))
    {
        return std::unexpected(make_config_error("/log/level", "must be trace, debug, info, warn or error"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_engine_config(const config::engine_t& engine)
{
    if (engine.id.find('\0') != std::string::npos)
    {
        return std::unexpected(make_config_error("/engine/id", "must not contain nul"));
    }
    if (engine.max_frame_size < kMinFrameSize || engine.max_frame_size > kMaxFrameSizeLimit)
    {
        return std::unexpected(make_config_error("/engine/max_frame_size", "must be between 64 and 268435456"));
    }
    if (engine.close_timeout_ms == 0)
    {
        return std::unexpected(make_config_error("/engine/close_timeout_ms", "must be greater than 0"));
    }
    if (engine.cleanup_dispatch_timeout_ms == 0)
    {
        return std::unexpected(make_config_error("/engine/cleanup_dispatch_timeout_ms", "must be greater than 0"));
    }
    return {};
}

[[nodiscard]] std::expected<void, config_error> validate_config(const config& cfg)
{
    if (const auto log_result = validate_log_config(cfg.log); !log_result)
    {
        return std::unexpected(log_result.error());
    }
    if (const auto engine_result = validate_engine_config(cfg.engine); !engine_result)
    {
        return std::unexpected(engine_result.error());
    }
    return {};
}

[[nodiscard]] std::expected<std::string, config_error> read_file(const std::string& filename)
{
    char buf[64 * 1024] = {0};
    std::string result;
    FILE* f = fopen(filename.c_str(), "rb");
    if (f == nullptr)
    {
        return std::unexpected(make_config_error("/", std::string("open file failed: ") + std::strerror(errno)));
    }
    for (;;)
    {
        const std::size_t n = fread(buf, 1, sizeof buf, f);
        if (n > 0)
        {
            result.append(buf, n);
        }
        if (n < sizeof buf)
        {
            if (ferror(f) != 0)
            {
                fclose(f);
                return std::unexpected(make_config_error("/", std::string("read file failed: ") + std::strerror(errno)));
            }
            break;
        }
    }
    fclose(f);
    return result;
}

}    // namespace

std::expected<config, config_error> deserialize_config_with_error(const std::string& text)
{
    if (const auto nul_pos = text.find('\0'); nul_pos != std::string::npos)
    {
        return std::unexpected(make_config_error("/", "json parse error at offset " + std::to_string(nul_pos) + ": embedded nul byte"));
    }
    rapidjson::Document reader;
    const rapidjson::ParseResult parse_result = reader.Parse(text.data(), text.size());
    if (parse_result.IsError())
    {
        return std::unexpected(make_config_error(
            "/", "json parse error at offset " + std::to_string(parse_result.Offset()) + ": " + rapidjson::GetParseError_En(parse_result.Code())));
    }

    config cfg;
    reflect::JsonReader json_reader{&reader};
    reflect::reflect(json_reader, cfg);
    if (!json_reader.ok())
    {
        return std::unexpected(make_config_error(json_reader.getPath(), "invalid type or value"));
    }
    if (const auto validate_result = validate_config(cfg); !validate_result)
    {
        return std::unexpected(validate_result.error());
    }
    return cfg;
}

std::expected<config, config_error> parse_config_with_error(const std::string& filename)
{
    const auto file_content = read_file(filename);
    if (!file_content)
    {
        return std::unexpected(file_content.error());
    }
    return deserialize_config_with_error(*file_content);
}

std::optional<config> parse_config(const std::string& filename)
{
    const auto parsed = parse_config_with_error(filename);
    if (!parsed)
    {
        return std::nullopt;
    }
    return *parsed;
}

std::string dump_config(const config& cfg) { return reflect::serialize_struct(cfg); }

std::string dump_default_config()
{
    config cfg;
    cfg.execution.test_assembly_unique_id = "tcpengine-sample-assembly";
    cfg.execution.test_framework_display_name = "tcpengine";
    return dump_config(cfg);
}

}    // namespace tcpengine
