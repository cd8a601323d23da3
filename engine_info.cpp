#include <string>
#include <utility>
#include <expected>
#include <optional>
#include <string_view>

#include <boost/system/error_code.hpp>

#include "log.h"
#include "reflect.h"
#include "engine_info.h"
#include "engine_errors.h"

namespace tcpengine
{

namespace
{

struct engine_info_document
{
    std::optional<std::string> protocol_version;
    std::optional<std::string> test_assembly_unique_id;
    std::optional<std::string> test_framework_display_name;
};

[[nodiscard]] boost::system::error_code invalid_argument()
{
    return boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
}

[[nodiscard]] boost::system::error_code assign_non_empty(std::string& field, std::string value)
{
    if (value.empty())
    {
        return invalid_argument();
    }
    field = std::move(value);
    return {};
}

[[nodiscard]] boost::system::error_code assign_non_empty(std::optional<std::string>& field, std::string value)
{
    if (value.empty())
    {
        return invalid_argument();
    }
    field = std::move(value);
    return {};
}

}    // namespace

}    // namespace tcpengine

namespace reflect
{

template <typename Vis>
void reflect(Vis& vis, tcpengine::engine_info_document& v)
{
    reflectMemberStart(vis);
    reflectMember(vis, "protocolVersion", v.protocol_version);
    reflectMember(vis, "testAssemblyUniqueID", v.test_assembly_unique_id);
    reflectMember(vis, "testFrameworkDisplayName", v.test_framework_display_name);
    reflectMemberEnd(vis);
}

}    // namespace reflect

namespace tcpengine
{

namespace
{

[[nodiscard]] std::expected<engine_info_document, boost::system::error_code> parse_document(const std::string_view json)
{
    engine_info_document doc;
    if (const auto parsed = reflect::deserialize_struct_with_error(doc, json); !parsed)
    {
        LOG_DEBUG("engine info decode failed path {} reason {}", parsed.error().path, parsed.error().reason);
        return std::unexpected(boost::system::errc::make_error_code(boost::system::errc::bad_message));
    }
    return doc;
}

}    // namespace

std::expected<std::string, boost::system::error_code> execution_engine_info::test_assembly_unique_id() const
{
    if (!test_assembly_unique_id_.has_value())
    {
        return std::unexpected(make_error_code(engine_errc::kUnsetProperty));
    }
    return *test_assembly_unique_id_;
}

std::expected<std::string, boost::system::error_code> execution_engine_info::test_framework_display_name() const
{
    if (!test_framework_display_name_.has_value())
    {
        return std::unexpected(make_error_code(engine_errc::kUnsetProperty));
    }
    return *test_framework_display_name_;
}

boost::system::error_code execution_engine_info::set_protocol_version(std::string value) { return assign_non_empty(protocol_version_, std::move(value)); }

boost::system::error_code execution_engine_info::set_test_assembly_unique_id(std::string value)
{
    return assign_non_empty(test_assembly_unique_id_, std::move(value));
}

boost::system::error_code execution_engine_info::set_test_framework_display_name(std::string value)
{
    return assign_non_empty(test_framework_display_name_, std::move(value));
}

boost::system::error_code runner_engine_info::set_protocol_version(std::string value) { return assign_non_empty(protocol_version_, std::move(value)); }

std::string serialize_engine_info(const execution_engine_info& info)
{
    engine_info_document doc;
    doc.protocol_version = info.protocol_version_;
    doc.test_assembly_unique_id = info.test_assembly_unique_id_;
    doc.test_framework_display_name = info.test_framework_display_name_;
    return reflect::serialize_struct(doc);
}

std::string serialize_engine_info(const runner_engine_info& info)
{
    engine_info_document doc;
    doc.protocol_version = info.protocol_version();
    return reflect::serialize_struct(doc);
}

std::expected<execution_engine_info, boost::system::error_code> deserialize_execution_engine_info(const std::string_view json)
{
    auto doc = parse_document(json);
    if (!doc)
    {
        return std::unexpected(doc.error());
    }

    execution_engine_info info;
    if (doc->protocol_version.has_value())
    {
        if (const auto ec = info.set_protocol_version(std::move(*doc->protocol_version)); ec)
        {
            return std::unexpected(ec);
        }
    }
    if (doc->test_assembly_unique_id.has_value())
    {
        if (const auto ec = info.set_test_assembly_unique_id(std::move(*doc->test_assembly_unique_id)); ec)
        {
            return std::unexpected(ec);
        }
    }
    if (doc->test_framework_display_name.has_value())
    {
        if (const auto ec = info.set_test_framework_display_name(std::move(*doc->test_framework_display_name)); ec)
        {
            return std::unexpected(ec);
        }
    }
    return info;
}

std::expected<runner_engine_info, boost::system::error_code> deserialize_runner_engine_info(const std::string_view json)
{
    auto doc = parse_document(json);
    if (!doc)
    {
        return std::unexpected(doc.error());
    }

    runner_engine_info info;
    if (doc->protocol_version.has_value())
    {
        if (const auto ec = info.set_protocol_version(std::move(*doc->protocol_version)); ec)
        {
            return std::unexpected(ec);
        }
    }
    return info;
}

}    // namespace tcpengine
