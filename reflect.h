#ifndef REFLECT_H
#define REFLECT_H

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <functional>
#include <limits>
#include <string_view>
#include <type_traits>

#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"

namespace hsguard::reflect
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
    [[nodiscard]] std::string getString() const { return m->GetString(); }
    [[nodiscard]] std::string getPath() const;
};

struct JsonWriter
{
    using W = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

    W* m;

    explicit JsonWriter(W* m) : m(m) {}
    void startArray() const { m->StartArray(); }
    void endArray() const { m->EndArray(); }
    void startObject() const { m->StartObject(); }
    void endObject() const { m->EndObject(); }
    void key(const char* name) const { m->Key(name); }
    void key(const std::string& name) const { m->Key(name.data(), static_cast<rapidjson::SizeType>(name.size())); }
    void null_() const { m->Null(); }
    void boolean(const bool v) const { m->Bool(v); }
    void int64(const std::int64_t v) const { m->Int64(v); }
    void uint64(const std::uint64_t v) const { m->Uint64(v); }
    void double_(const double v) const { m->Double(v); }
    void string(const char* s, std::size_t len) const { m->String(s, static_cast<rapidjson::SizeType>(len)); }
    void string(const std::string_view s) const { string(s.data(), s.size()); }
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
        return invalid_path_.empty() ? "/" : invalid_path_;
    }

    std::string result = "/";
    for (std::size_t i = 0; i < path_.size(); ++i)
    {
        if (i != 0)
        {
            result.push_back('/');
        }
        result.append(path_[i]);
    }
    return result;
}

template <typename T>
bool read_unsigned_integer(JsonReader& vis, T& out)
{
    if (!vis.m->IsUint64())
    {
        vis.set_invalid();
        return false;
    }
    const auto value = vis.m->GetUint64();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
    {
        vis.set_invalid();
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

template <typename T>
bool read_signed_integer(JsonReader& vis, T& out)
{
    if (!vis.m->IsInt64())
    {
        vis.set_invalid();
        return false;
    }
    const auto value = vis.m->GetInt64();
    if (value < static_cast<std::int64_t>(std::numeric_limits<T>::min()) || value > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
    {
        vis.set_invalid();
        return false;
    }
    out = static_cast<T>(value);
    return true;
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
template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>, int> = 0>
inline void reflect(JsonReader& vis, T& v)
{
    (void)read_signed_integer(vis, v);
}
template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>, int> = 0>
inline void reflect(JsonReader& vis, T& v)
{
    (void)read_unsigned_integer(vis, v);
}
inline void reflect(JsonReader& vis, double& v)
{
    if (!vis.m->IsNumber())
    {
        vis.set_invalid();
        return;
    }
    v = vis.m->GetDouble();
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

inline void reflect(JsonWriter& vis, bool& v) { vis.boolean(v); }
template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>, int> = 0>
inline void reflect(JsonWriter& vis, T& v)
{
    vis.int64(static_cast<std::int64_t>(v));
}
template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>, int> = 0>
inline void reflect(JsonWriter& vis, T& v)
{
    vis.uint64(static_cast<std::uint64_t>(v));
}
inline void reflect(JsonWriter& vis, double& v) { vis.double_(v); }
inline void reflect(JsonWriter& vis, std::string& v) { vis.string(v); }
inline void reflect(JsonWriter& vis, std::string_view& v) { vis.string(v); }

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
void reflect(JsonWriter& vis, std::map<std::string, T>& v)
{
    vis.startObject();
    for (auto& pair : v)
    {
        vis.key(pair.first);
        reflect(vis, pair.second);
    }
    vis.endObject();
}
template <typename T>
void reflect(JsonWriter& vis, std::vector<T>& v)
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

// Members missing from the document keep their defaults.
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

template <typename T>
inline std::string serialize_struct(const T& t)
{
    using non_const_t = std::remove_const_t<T>;
    auto& nt = const_cast<non_const_t&>(t);
    rapidjson::StringBuffer sb;
    JsonWriter::W writer(sb);
    JsonWriter json_writer(&writer);
    reflect(json_writer, nt);
    return sb.GetString();
}

}    // namespace hsguard::reflect

#endif
