#ifndef ENGINE_INFO_H
#define ENGINE_INFO_H

#include <string>
#include <expected>
#include <optional>
#include <string_view>

#include <boost/system/error_code.hpp>

#include "engine_protocol.h"

namespace tcpengine
{

// Identity the execution engine reports in its INFO frame.
class execution_engine_info
{
   public:
    [[nodiscard]] const std::string& protocol_version() const { return protocol_version_; }
    [[nodiscard]] std::expected<std::string, boost::system::error_code> test_assembly_unique_id() const;
    [[nodiscard]] std::expected<std::string, boost::system::error_code> test_framework_display_name() const;

    // Empty values are rejected with errc::invalid_argument and leave the record unchanged.
    [[nodiscard]] boost::system::error_code set_protocol_version(std::string value);
    [[nodiscard]] boost::system::error_code set_test_assembly_unique_id(std::string value);
    [[nodiscard]] boost::system::error_code set_test_framework_display_name(std::string value);

    [[nodiscard]] bool has_test_assembly_unique_id() const { return test_assembly_unique_id_.has_value(); }
    [[nodiscard]] bool has_test_framework_display_name() const { return test_framework_display_name_.has_value(); }

    bool operator==(const execution_engine_info&) const = default;

   private:
    friend std::string serialize_engine_info(const execution_engine_info& info);

    std::string protocol_version_{protocol::kProtocolVersion1_0};
    std::optional<std::string> test_assembly_unique_id_;
    std::optional<std::string> test_framework_display_name_;
};

// Identity the runner reports in its INFO frame.
class runner_engine_info
{
   public:
    [[nodiscard]] const std::string& protocol_version() const { return protocol_version_; }
    [[nodiscard]] boost::system::error_code set_protocol_version(std::string value);

    bool operator==(const runner_engine_info&) const = default;

   private:
    std::string protocol_version_{protocol::kProtocolVersion1_0};
};

[[nodiscard]] std::string serialize_engine_info(const execution_engine_info& info);
[[nodiscard]] std::string serialize_engine_info(const runner_engine_info& info);

// errc::bad_message for malformed json or mistyped members, errc::invalid_argument for
// empty strings. Missing members are not an error here.
[[nodiscard]] std::expected<execution_engine_info, boost::system::error_code> deserialize_execution_engine_info(std::string_view json);
[[nodiscard]] std::expected<runner_engine_info, boost::system::error_code> deserialize_runner_engine_info(std::string_view json);

}    // namespace tcpengine

#endif
