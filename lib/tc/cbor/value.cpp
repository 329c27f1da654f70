/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <array>
#include <iterator>
#include <limits>
#include <boost/container_hash/hash.hpp>
#include <tc/cbor/value.hpp>

namespace typed_cbor::cbor {
    value_tag::value_tag(const uint64_t id_, value &&val_):
        id { id_ }, val { std::make_unique<value>(std::move(val_)) }
    {
    }

    value_tag::value_tag(const value_tag &o):
        id { o.id }, val { o.val ? std::make_unique<value>(*o.val) : nullptr }
    {
    }

    value_tag::~value_tag() =default;

    value_tag &value_tag::operator=(const value_tag &o)
    {
        if (this != &o) {
            id = o.id;
            val = o.val ? std::make_unique<value>(*o.val) : nullptr;
        }
        return *this;
    }

    bool value_tag::operator==(const value_tag &o) const
    {
        if (id != o.id)
            return false;
        if (!val || !o.val)
            return !val && !o.val;
        return *val == *o.val;
    }

    const std::string &value::type_name(const major_type type)
    {
        static std::array<std::string, 8> names {
            "unsigned integer", "negative integer", "bytes", "text",
            "array", "map", "tag", "simple"
        };
        const auto type_idx = static_cast<size_t>(type);
        if (type_idx >= names.size()) [[unlikely]]
            throw error(fmt::format("unsupported CBOR major type index: {}", type_idx));
        return names[type_idx];
    }

    const std::string &value::type_name() const
    {
        return type_name(major());
    }

    bool value::operator==(const value &o) const
    {
        return _storage == o._storage;
    }

    static std::partial_ordering compare_items(const value_array &a, const value_array &b)
    {
        const auto min_sz = std::min(a.size(), b.size());
        for (size_t i = 0; i < min_sz; ++i) {
            if (const auto cmp = a[i] <=> b[i]; cmp != 0)
                return cmp;
        }
        return a.size() <=> b.size();
    }

    static std::partial_ordering compare_entries(const value_map &a, const value_map &b)
    {
        const auto min_sz = std::min(a.size(), b.size());
        for (size_t i = 0; i < min_sz; ++i) {
            if (const auto cmp = a[i].first <=> b[i].first; cmp != 0)
                return cmp;
            if (const auto cmp = a[i].second <=> b[i].second; cmp != 0)
                return cmp;
        }
        return a.size() <=> b.size();
    }

    std::partial_ordering value::operator<=>(const value &o) const
    {
        if (const auto cmp = _storage.index() <=> o._storage.index(); cmp != 0)
            return cmp;
        switch (_storage.index()) {
            case 0: return uint() <=> o.uint();
            // a bigger encoded magnitude is a smaller number
            case 1: return o.nint() <=> nint();
            case 2: return bytes() <=> o.bytes();
            case 3: return text() <=> o.text();
            case 4: return compare_items(array(), o.array());
            case 5: return compare_entries(map(), o.map());
            case 6: {
                const auto &t = tag();
                const auto &ot = o.tag();
                if (const auto cmp = t.id <=> ot.id; cmp != 0)
                    return cmp;
                if (!t.val || !ot.val)
                    return static_cast<bool>(t.val) <=> static_cast<bool>(ot.val);
                return *t.val <=> *ot.val;
            }
            case 7: return simple() <=> o.simple();
            case 8: return float64() <=> o.float64();
            default:
                throw error(fmt::format("unsupported value variant index: {}", _storage.index()));
        }
    }

    size_t value::hash() const noexcept
    {
        size_t seed = _storage.index();
        std::visit([&seed](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, nint_value>) {
                boost::hash_combine(seed, v.raw);
            } else if constexpr (std::is_same_v<T, simple_value>) {
                boost::hash_combine(seed, v.code);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                boost::hash_range(seed, v.begin(), v.end());
            } else if constexpr (std::is_same_v<T, value_array>) {
                for (const auto &item: v)
                    boost::hash_combine(seed, item.hash());
            } else if constexpr (std::is_same_v<T, value_map>) {
                for (const auto &[key, val]: v) {
                    boost::hash_combine(seed, key.hash());
                    boost::hash_combine(seed, val.hash());
                }
            } else if constexpr (std::is_same_v<T, value_tag>) {
                boost::hash_combine(seed, v.id);
                if (v.val)
                    boost::hash_combine(seed, v.val->hash());
            } else {
                // uint64_t, std::string and double; boost::hash maps 0.0 and -0.0 to the same hash
                boost::hash_combine(seed, v);
            }
        }, _storage);
        return seed;
    }

    major_type value::major() const noexcept
    {
        switch (_storage.index()) {
            case 0: return major_type::uint;
            case 1: return major_type::nint;
            case 2: return major_type::bytes;
            case 3: return major_type::text;
            case 4: return major_type::array;
            case 5: return major_type::map;
            case 6: return major_type::tag;
            default: return major_type::simple;
        }
    }

    std::string_view value::variant_name() const noexcept
    {
        switch (_storage.index()) {
            case 0: return "uint";
            case 1: return "nint";
            case 2: return "bytes";
            case 3: return "text";
            case 4: return "array";
            case 5: return "map";
            case 6: return "tag";
            case 7: return "simple";
            case 8: return "float";
            default: return "unknown";
        }
    }

    std::string format_negative(const uint64_t raw)
    {
        // -1 - (2^64 - 1) does not fit into any native integer type
        if (raw == std::numeric_limits<uint64_t>::max()) [[unlikely]]
            return "-18446744073709551616";
        return fmt::format("-{}", raw + 1);
    }

    static void indent_to(std::string &out, const size_t depth)
    {
        out.append(depth * 3, ' ');
    }

    static void format_value(std::string &out, const value &v, const size_t depth)
    {
        auto out_it = std::back_inserter(out);
        switch (v.storage().index()) {
            case 0:
                fmt::format_to(out_it, "{}", v.uint());
                break;
            case 1:
                out += format_negative(v.nint());
                break;
            case 2: {
                const auto &b = v.bytes();
                out += '[';
                for (size_t i = 0; i < b.size(); ++i)
                    fmt::format_to(out_it, "{}{}", i ? ", " : "", static_cast<unsigned>(b[i]));
                out += ']';
                break;
            }
            case 3:
                fmt::format_to(out_it, "\"{}\"", v.text());
                break;
            case 4: {
                const auto &a = v.array();
                if (a.empty()) {
                    out += "[]";
                    break;
                }
                out += "[\n";
                for (const auto &item: a) {
                    indent_to(out, depth + 1);
                    format_value(out, item, depth + 1);
                    out += ",\n";
                }
                indent_to(out, depth);
                out += ']';
                break;
            }
            case 5: {
                const auto &m = v.map();
                if (m.empty()) {
                    out += "{}";
                    break;
                }
                out += "{\n";
                for (const auto &[key, val]: m) {
                    indent_to(out, depth + 1);
                    format_value(out, key, depth + 1);
                    out += ": ";
                    format_value(out, val, depth + 1);
                    out += ",\n";
                }
                indent_to(out, depth);
                out += '}';
                break;
            }
            case 6: {
                const auto &t = v.tag();
                fmt::format_to(out_it, "{}(", t.id);
                if (t.val)
                    format_value(out, *t.val, depth);
                out += ')';
                break;
            }
            case 7:
                switch (const auto code = v.simple(); code) {
                    case static_cast<uint8_t>(special_val::s_false):
                    case static_cast<uint8_t>(special_val::s_true):
                    case static_cast<uint8_t>(special_val::s_null):
                    case static_cast<uint8_t>(special_val::s_undefined):
                        fmt::format_to(out_it, "{}", static_cast<special_val>(code));
                        break;
                    default:
                        fmt::format_to(out_it, "simple({})", code);
                        break;
                }
                break;
            case 8:
                fmt::format_to(out_it, "{}", v.float64());
                break;
            default:
                throw error(fmt::format("unsupported value variant index: {}", v.storage().index()));
        }
    }

    std::string value::to_string() const
    {
        std::string out {};
        format_value(out, *this, 0);
        return out;
    }
}
