#ifndef REFLECT_H
#define REFLECT_H

#include <string>
#include <vector>
#include <cstdint>
#include <expected>
#include <optional>
#include <functional>
#include <limits>
#include <string_view>
#include <type_traits>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/error/en.h>

namespace reflect
{

struct JsonReader
{
    rapidjson::Value* m;
    std::vector<std::string> path_;
    std::string invalid_path_;
    bool ok_ = true;

    explicit JsonReader(rapidjson::Value* m) : m(m) {}
    void iterArray(const std::function<void()>& fn);
    void member(const char* name, const std::function<void()>& fn);
    void set_invalid();
    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] bool isNull() const { return m->IsNull(); }
    [[nodiscard]] std::string getString() const { return std::string(m->GetString(), m->GetStringLength()); }
    [[nodiscard]] std::string getPath() const;
};

struct JsonWriter
{
    using W = rapidjson::Writer<rapidjson::StringBuffer>;

    W* m;

    explicit JsonWriter(W* m) : m(m) {}
    void startArray() const { m->StartArray(); }
    void endArray() const { m->EndArray(); }
    void startObject() const { m->StartObject(); }
    void endObject() const { m->EndObject(); }
    void key(const char* name) const { m->Key(name); }
    void null_() const { m->Null(); }
    void string(const char* s, std::size_t len) const { m->String(s, static_cast<rapidjson::SizeType>(len)); }
};

struct json_error
{
    std::string path = "/";
    std::string reason;
};

inline void JsonReader::set_invalid()
{
    if (!ok_)
    {
        return;
    }
    invalid_path_ = getPath();
    ok_ = false;
}

inline std::string JsonReader::getPath() const
{
    if (!ok_)
    {
        return invalid_path_.empty() ? std::string("/") : invalid_path_;
    }
    if (path_.empty())
    {
        return "/";
    }

    std::string result;
    for (const auto& segment : path_)
    {
        result.push_back('/');
        result.append(segment);
    }
    return result;
}

inline void JsonReader::iterArray(const std::function<void()>& fn)
{
    if (!ok_)
    {
        return;
    }
    if (!m->IsArray())
    {
        set_invalid();
        return;
    }
    path_.emplace_back("0");
    std::size_t index = 0;
    for (auto& entry : m->GetArray())
    {
        if (!ok_)
        {
            break;
        }
        path_.back() = std::to_string(index);
        auto* saved = m;
        m = &entry;
        fn();
        m = saved;
        ++index;
    }
    path_.pop_back();
}

inline void JsonReader::member(const char* name, const std::function<void()>& fn)
{
    if (!ok_)
    {
        return;
    }
    path_.emplace_back(name);
    auto it = m->FindMember(name);
    if (it != m->MemberEnd())
    {
        auto* saved = m;
        m = &it->value;
        fn();
        m = saved;
    }
    path_.pop_back();
}

inline void reflect(JsonReader& vis, bool& v)
{
    if (!vis.m->IsBool())
    {
        vis.set_invalid();
        return;
    }
    v = vis.m->GetBool();
}

template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>, int> = 0>
inline void reflect(JsonReader& vis, T& v)
{
    if (!vis.m->IsUint64())
    {
        vis.set_invalid();
        return;
    }
    const auto value = vis.m->GetUint64();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
    {
        vis.set_invalid();
        return;
    }
    v = static_cast<T>(value);
}

template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>, int> = 0>
inline void reflect(JsonReader& vis, T& v)
{
    if (!vis.m->IsInt64())
    {
        vis.set_invalid();
        return;
    }
    const auto value = vis.m->GetInt64();
    if (value < static_cast<std::int64_t>(std::numeric_limits<T>::min()) || value > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
    {
        vis.set_invalid();
        return;
    }
    v = static_cast<T>(value);
}

inline void reflect(JsonReader& vis, std::string& v)
{
    if (!vis.m->IsString())
    {
        vis.set_invalid();
        return;
    }
    v = vis.getString();
}

inline void reflect(JsonWriter& vis, bool& v) { vis.m->Bool(v); }

template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>, int> = 0>
inline void reflect(JsonWriter& vis, T& v)
{
    vis.m->Uint64(static_cast<std::uint64_t>(v));
}

template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>, int> = 0>
inline void reflect(JsonWriter& vis, T& v)
{
    vis.m->Int64(static_cast<std::int64_t>(v));
}

inline void reflect(JsonWriter& vis, std::string& v) { vis.string(v.data(), v.size()); }

template <typename T>
void reflect(JsonReader& vis, std::optional<T>& v)
{
    if (!vis.ok())
    {
        return;
    }
    if (vis.isNull())
    {
        v = std::nullopt;
        return;
    }
    v.emplace();
    reflect(vis, *v);
}

template <typename T>
void reflect(JsonWriter& vis, std::optional<T>& v)
{
    if (v)
    {
        reflect(vis, *v);
    }
    else
    {
        vis.null_();
    }
}

template <typename T>
inline void reflect(JsonReader& vis, std::vector<T>& v)
{
    vis.iterArray(
        [&]()
        {
            v.emplace_back();
            reflect(vis, v.back());
        });
}

template <typename T>
inline void reflect(JsonWriter& vis, std::vector<T>& v)
{
    vis.startArray();
    for (auto& it : v)
    {
        reflect(vis, it);
    }
    vis.endArray();
}

inline void reflectMemberStart(JsonReader& vis)
{
    if (!vis.m->IsObject())
    {
        vis.set_invalid();
    }
}
inline void reflectMemberStart(JsonWriter& vis) { vis.startObject(); }

inline void reflectMemberEnd(JsonReader& vis) { (void)vis; }
inline void reflectMemberEnd(JsonWriter& vis) { vis.endObject(); }

template <typename T>
inline void reflectMember(JsonReader& vis, const char* name, T& v)
{
    if (!vis.ok())
    {
        return;
    }
    vis.member(name, [&]() { reflect(vis, v); });
}

template <typename T>
inline void reflectMember(JsonWriter& vis, const char* name, T& v)
{
    vis.key(name);
    reflect(vis, v);
}

// unset optionals are omitted instead of written as null
template <typename T>
inline void reflectMember(JsonWriter& vis, const char* name, std::optional<T>& v)
{
    if (v.has_value())
    {
        vis.key(name);
        reflect(vis, *v);
    }
}

#define REFLECT_MEMBER(name) reflectMember(vis, #name, v.name)

template <typename T>
inline std::expected<void, json_error> deserialize_struct_with_error(T& t, std::string_view msg)
{
    rapidjson::Document reader;
    const rapidjson::ParseResult parse_result = reader.Parse(msg.data(), msg.size());
    if (parse_result.IsError())
    {
        return std::unexpected(json_error{.path = "/",
                                          .reason = "json parse error at offset " + std::to_string(parse_result.Offset()) + ": " +
                                                    rapidjson::GetParseError_En(parse_result.Code())});
    }

    JsonReader json_reader{&reader};
    reflect(json_reader, t);
    if (!json_reader.ok())
    {
        return std::unexpected(json_error{.path = json_reader.getPath(), .reason = "invalid type or value"});
    }
    return {};
}

template <typename T>
inline bool deserialize_struct(T& t, std::string_view msg)
{
    return deserialize_struct_with_error(t, msg).has_value();
}

template <typename T>
inline std::string serialize_struct(const T& t)
{
    using non_const_t = std::remove_const_t<T>;
    auto& nt = const_cast<non_const_t&>(t);
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
    JsonWriter json_writer(&writer);
    reflect(json_writer, nt);
    return std::string(sb.GetString(), sb.GetSize());
}

}    // namespace reflect

#endif
