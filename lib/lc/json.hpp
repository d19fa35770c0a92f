/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_JSON_HPP
#define LEDGER_CORE_JSON_HPP

#include <concepts>
#include <limits>
#include <ostream>
#include <sstream>
#include <boost/json.hpp>
#include <lc/array.hpp>
#include <lc/file.hpp>

namespace ledger_core::json {
    using namespace boost::json;

    inline json::value load(const std::string &path)
    {
        const auto raw = file::read(path);
        return json::parse(raw.str());
    }

    inline const json::value &field(const json::object &obj, const std::string_view name)
    {
        if (const auto *v = obj.if_contains(name); v) [[likely]]
            return *v;
        throw error(fmt::format("JSON object does not contain the required field: {}", name));
    }

    inline const json::object &field_object(const json::object &obj, const std::string_view name)
    {
        const auto &v = field(obj, name);
        if (!v.is_object()) [[unlikely]]
            throw error(fmt::format("JSON field {} must be an object", name));
        return v.get_object();
    }

    inline const json::array &field_array(const json::object &obj, const std::string_view name)
    {
        const auto &v = field(obj, name);
        if (!v.is_array()) [[unlikely]]
            throw error(fmt::format("JSON field {} must be an array", name));
        return v.get_array();
    }

    inline const json::object &as_object(const json::value &v)
    {
        if (!v.is_object()) [[unlikely]]
            throw error(fmt::format("expected a JSON object but got: {}", json::serialize(v)));
        return v.get_object();
    }

    inline const json::array &as_array(const json::value &v)
    {
        if (!v.is_array()) [[unlikely]]
            throw error(fmt::format("expected a JSON array but got: {}", json::serialize(v)));
        return v.get_array();
    }

    inline std::string_view as_str(const json::value &v)
    {
        if (!v.is_string()) [[unlikely]]
            throw error(fmt::format("expected a JSON string but got: {}", json::serialize(v)));
        const auto &s = v.get_string();
        return { s.data(), s.size() };
    }

    template<std::unsigned_integral T>
    T to_uint(const json::value &v)
    {
        uint64_t u;
        switch (v.kind()) {
            case json::kind::uint64:
                u = v.get_uint64();
                break;
            case json::kind::int64:
                if (v.get_int64() < 0) [[unlikely]]
                    throw error(fmt::format("expected a non-negative integer but got: {}", v.get_int64()));
                u = static_cast<uint64_t>(v.get_int64());
                break;
            default:
                throw error(fmt::format("expected an unsigned integer but got: {}", json::serialize(v)));
        }
        if (u > std::numeric_limits<T>::max()) [[unlikely]]
            throw error(fmt::format("integer value {} does not fit into {} bytes", u, sizeof(T)));
        return static_cast<T>(u);
    }

    template<std::unsigned_integral T>
    T field_uint(const json::object &obj, const std::string_view name)
    {
        try {
            return to_uint<T>(field(obj, name));
        } catch (const std::exception &ex) {
            throw error(fmt::format("invalid value of JSON field {}", name), ex);
        }
    }

    template<size_t SZ>
    byte_array<SZ> to_bytes(const json::value &v)
    {
        return byte_array<SZ>::from_hex(as_str(v));
    }

    inline void save_pretty(std::ostream& os, json::value const &jv, std::string *indent = nullptr)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if (!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case json::kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << "{\n";
                indent->append(indent_step, ' ');
                for (auto it = obj.begin(), last = std::prev(obj.end()); it != obj.end(); ++it) {
                    os << *indent << json::serialize(it->key()) << ": ";
                    save_pretty(os, it->value(), indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "}";
                break;
            }
            case json::kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << "[\n";
                indent->append(indent_step, ' ');
                for (auto it = arr.begin(), last = std::prev(arr.end()); it != arr.end(); ++it) {
                    os << *indent;
                    save_pretty(os, *it, indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "]";
                break;
            }
            case json::kind::string:
                os << json::serialize(jv.get_string());
                break;
            case json::kind::uint64:
                os << jv.get_uint64();
                break;
            case json::kind::int64:
                os << jv.get_int64();
                break;
            case json::kind::double_:
                os << jv.get_double();
                break;
            case json::kind::bool_:
                if (jv.get_bool())
                    os << "true";
                else
                    os << "false";
                break;
            case json::kind::null:
                os << "null";
                break;
        }
    }

    inline std::string serialize_pretty(const json::value &jv)
    {
        std::ostringstream os {};
        save_pretty(os, jv);
        return os.str();
    }

    inline void save_pretty(const std::string &path, const json::value &jv)
    {
        file::write(path, serialize_pretty(jv));
    }
}

#endif // !LEDGER_CORE_JSON_HPP
