#include <string>
#include <cstdint>
#include <utility>
#include <expected>
#include <optional>
#include <string_view>

#include <boost/system/error_code.hpp>

#include "reflect.h"
#include "engine_message.h"

namespace tcpengine
{

namespace
{

struct message_header
{
    std::optional<std::string> type;
};

struct error_message_document
{
    std::string type;
    std::string errorCategory;
    std::int64_t errorCode = 0;
    std::string message;
};

}    // namespace

}    // namespace tcpengine

namespace reflect
{

template <typename Vis>
void reflect(Vis& vis, tcpengine::message_header& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(type);
    reflectMemberEnd(vis);
}

template <typename Vis>
void reflect(Vis& vis, tcpengine::error_message_document& v)
{
    reflectMemberStart(vis);
    REFLECT_MEMBER(type);
    REFLECT_MEMBER(errorCategory);
    REFLECT_MEMBER(errorCode);
    REFLECT_MEMBER(message);
    reflectMemberEnd(vis);
}

}    // namespace reflect

namespace tcpengine
{

std::expected<engine_message, boost::system::error_code> parse_engine_message(const std::string_view json)
{
    message_header header;
    if (!reflect::deserialize_struct(header, json))
    {
        return std::unexpected(boost::system::errc::make_error_code(boost::system::errc::bad_message));
    }

    engine_message message;
    message.type = header.type.value_or(std::string());
    message.json = std::string(json);
    return message;
}

engine_message make_engine_message(std::string type)
{
    message_header header;
    header.type = type;

    engine_message message;
    message.type = std::move(type);
    message.json = reflect::serialize_struct(header);
    return message;
}

engine_message make_error_message(const boost::system::error_code& ec)
{
    error_message_document doc;
    doc.type = std::string(kErrorMessageType);
    doc.errorCategory = ec.category().name();
    doc.errorCode = ec.value();
    doc.message = ec.message();

    engine_message message;
    message.type = doc.type;
    message.json = reflect::serialize_struct(doc);
    return message;
}

}    // namespace tcpengine
