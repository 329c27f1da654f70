/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_CBOR_PROJECTOR_HPP
#define TYPED_CBOR_CBOR_PROJECTOR_HPP

#include <cmath>
#include <concepts>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <tc/config.hpp>
#include <tc/narrow-cast.hpp>
#include <tc/cbor/value.hpp>

namespace typed_cbor::cbor {
    // A tag number together with the projected tag content.
    template<typename T>
    struct tagged {
        uint64_t id = 0;
        T val {};

        bool operator==(const tagged<T> &o) const =default;
    };

    // Map entries in their source order with duplicates kept.
    template<typename K, typename V>
    struct map_entries: vector<std::pair<K, V>> {
        using base_type = vector<std::pair<K, V>>;
        using base_type::base_type;
    };

    template<typename M>
    concept map_like = requires(M m, typename M::key_type k, typename M::mapped_type v) {
        m.try_emplace(std::move(k), std::move(v));
        m.begin()->second = std::move(v);
    };

    // Structural path of a value being projected: $ is the root, [i] an array element,
    // {key} a map value by its key or {#i} by its entry index, .key the key of an entry,
    // (n) the content of a tag with the number n.
    struct projection_context {
        const decode_config &cfg;
        std::string path { "$" };
        size_t depth = 0;

        explicit projection_context(const decode_config &cfg_): cfg { cfg_ }
        {
        }

        decode_error fail(const error_kind kind, const std::string_view detail) const
        {
            return decode_error { kind, path, detail };
        }

        decode_error mismatch(const std::string_view expected, const value &v) const
        {
            return fail(error_kind::type_mismatch, fmt::format("expected {} but got {}", expected, v.variant_name()));
        }
    };

    struct path_scope {
        template<typename... Args>
        path_scope(projection_context &ctx, const fmt::format_string<Args...> segment, Args&&... a):
            _ctx { ctx }, _prev_size { ctx.path.size() }
        {
            fmt::format_to(std::back_inserter(_ctx.path), segment, std::forward<Args>(a)...);
        }

        path_scope(const path_scope &) =delete;

        ~path_scope()
        {
            _ctx.path.resize(_prev_size);
        }
    private:
        projection_context &_ctx;
        const size_t _prev_size;
    };

    struct nesting_scope {
        explicit nesting_scope(projection_context &ctx): _ctx { ctx }
        {
            if (_ctx.depth >= _ctx.cfg.max_depth) [[unlikely]]
                throw _ctx.fail(error_kind::depth_exceeded, fmt::format("nesting is deeper than the limit of {} levels", _ctx.cfg.max_depth));
            ++_ctx.depth;
        }

        nesting_scope(const nesting_scope &) =delete;

        ~nesting_scope()
        {
            --_ctx.depth;
        }
    private:
        projection_context &_ctx;
    };

    template<typename T>
    struct projector;

    template<typename T>
    T project(const value &v, projection_context &ctx)
    {
        return projector<T>::project(v, ctx);
    }

    template<typename T>
    T project(const value &v, const decode_config &cfg={})
    {
        projection_context ctx { cfg };
        return projector<T>::project(v, ctx);
    }

    template<std::integral T>
        requires (!std::same_as<T, bool>)
    struct projector<T> {
        static T project(const value &v, projection_context &ctx)
        {
            if (const auto *u = v.get_if<uint64_t>(); u) {
                if (!fits<T>(*u)) [[unlikely]]
                    throw ctx.fail(error_kind::integer_overflow, fmt::format("{} does not fit into {}", *u, _name()));
                return static_cast<T>(*u);
            }
            if (const auto *n = v.get_if<nint_value>(); n) {
                if constexpr (std::is_signed_v<T>) {
                    // -1 - raw >= min() iff raw <= max()
                    if (n->raw <= static_cast<uint64_t>(std::numeric_limits<T>::max())) [[likely]]
                        return static_cast<T>(-1 - static_cast<T>(n->raw));
                }
                throw ctx.fail(error_kind::integer_overflow, fmt::format("{} does not fit into {}", format_negative(n->raw), _name()));
            }
            throw ctx.mismatch("an integer", v);
        }
    private:
        static std::string _name()
        {
            return fmt::format("a {}-bit {} integer", sizeof(T) * 8, std::is_signed_v<T> ? "signed" : "unsigned");
        }
    };

    template<std::floating_point T>
    struct projector<T> {
        static T project(const value &v, projection_context &ctx)
        {
            double d;
            if (const auto *f = v.get_if<double>(); f) {
                d = *f;
            } else if (const auto *u = v.get_if<uint64_t>(); u && ctx.cfg.int_to_float) {
                d = static_cast<double>(*u);
            } else if (const auto *n = v.get_if<nint_value>(); n && ctx.cfg.int_to_float) {
                d = -1.0 - static_cast<double>(n->raw);
            } else {
                throw ctx.mismatch(ctx.cfg.int_to_float ? "a float or an integer" : "a float", v);
            }
            if constexpr (!std::is_same_v<T, double>) {
                if (std::isfinite(d) && std::fabs(d) > static_cast<double>(std::numeric_limits<T>::max())) [[unlikely]]
                    throw ctx.fail(error_kind::integer_overflow, fmt::format("{} is outside of the range of a {}-bit float", d, sizeof(T) * 8));
            }
            return static_cast<T>(d);
        }
    };

    template<>
    struct projector<bool> {
        static bool project(const value &v, projection_context &ctx)
        {
            if (const auto *s = v.get_if<simple_value>(); s) {
                switch (s->code) {
                    case static_cast<uint8_t>(special_val::s_false): return false;
                    case static_cast<uint8_t>(special_val::s_true): return true;
                    default: break;
                }
            }
            throw ctx.mismatch("a boolean", v);
        }
    };

    template<>
    struct projector<std::string> {
        static std::string project(const value &v, projection_context &ctx)
        {
            if (const auto *t = v.get_if<std::string>(); t) [[likely]]
                return *t;
            throw ctx.mismatch("a text string", v);
        }
    };

    template<>
    struct projector<uint8_vector> {
        static uint8_vector project(const value &v, projection_context &ctx)
        {
            if (const auto *b = v.get_if<uint8_vector>(); b) [[likely]]
                return *b;
            throw ctx.mismatch("a byte string", v);
        }
    };

    template<>
    struct projector<value> {
        static value project(const value &v, projection_context &)
        {
            return v;
        }
    };

    template<typename T>
    struct projector<std::optional<T>> {
        static std::optional<T> project(const value &v, projection_context &ctx)
        {
            if (v.is_null() || v.is_undefined())
                return {};
            return cbor::project<T>(v, ctx);
        }
    };

    template<typename T>
    struct projector<tagged<T>> {
        static tagged<T> project(const value &v, projection_context &ctx)
        {
            const auto *t = v.get_if<value_tag>();
            if (!t || !t->val) [[unlikely]]
                throw ctx.mismatch("a tag", v);
            nesting_scope nesting { ctx };
            path_scope path { ctx, "({})", t->id };
            return { t->id, cbor::project<T>(*t->val, ctx) };
        }
    };

    template<typename E>
    struct projector<std::vector<E>> {
        static std::vector<E> project(const value &v, projection_context &ctx)
        {
            const auto *items = v.get_if<value_array>();
            if (!items) [[unlikely]]
                throw ctx.mismatch("an array", v);
            nesting_scope nesting { ctx };
            std::vector<E> res {};
            res.reserve(items->size());
            for (size_t i = 0; i < items->size(); ++i) {
                path_scope path { ctx, "[{}]", i };
                res.emplace_back(cbor::project<E>((*items)[i], ctx));
            }
            return res;
        }
    };

    // Writes the path segment of a map value: scalar keys by content, other keys by the entry index.
    inline void format_map_segment(std::string &out, const value &key, const size_t idx)
    {
        auto out_it = std::back_inserter(out);
        if (const auto *u = key.get_if<uint64_t>(); u)
            fmt::format_to(out_it, "{{{}}}", *u);
        else if (const auto *n = key.get_if<nint_value>(); n)
            fmt::format_to(out_it, "{{{}}}", format_negative(n->raw));
        else if (const auto *t = key.get_if<std::string>(); t)
            fmt::format_to(out_it, "{{\"{}\"}}", *t);
        else
            fmt::format_to(out_it, "{{#{}}}", idx);
    }

    template<typename A, typename B>
    struct projector<std::pair<A, B>> {
        static std::pair<A, B> project(const value &v, projection_context &ctx)
        {
            if (const auto *items = v.get_if<value_array>(); items) {
                if (items->size() != 2) [[unlikely]]
                    throw ctx.fail(error_kind::type_mismatch, fmt::format("expected an array of 2 elements but got {}", items->size()));
                nesting_scope nesting { ctx };
                return { _project_item<A>((*items)[0], ctx, 0), _project_item<B>((*items)[1], ctx, 1) };
            }
            if (const auto *entries = v.get_if<value_map>(); entries) {
                if (entries->size() != 1) [[unlikely]]
                    throw ctx.fail(error_kind::type_mismatch, fmt::format("expected a map with 1 entry but got {}", entries->size()));
                nesting_scope nesting { ctx };
                const auto &[key, val] = entries->front();
                auto k = _project_key<A>(key, ctx);
                const auto prev_size = ctx.path.size();
                format_map_segment(ctx.path, key, 0);
                auto m = cbor::project<B>(val, ctx);
                ctx.path.resize(prev_size);
                return { std::move(k), std::move(m) };
            }
            throw ctx.mismatch("a 2-element array or a single-entry map", v);
        }
    private:
        template<typename T>
        static T _project_item(const value &item, projection_context &ctx, const size_t idx)
        {
            path_scope path { ctx, "[{}]", idx };
            return cbor::project<T>(item, ctx);
        }

        template<typename T>
        static T _project_key(const value &key, projection_context &ctx)
        {
            path_scope path { ctx, "{{#0}}.key" };
            return cbor::project<T>(key, ctx);
        }
    };

    template<typename M, typename F>
    void project_map_entries(const value &v, projection_context &ctx, const F &observer)
    {
        using key_type = std::remove_const_t<typename M::value_type::first_type>;
        using mapped_type = typename M::value_type::second_type;
        const auto *entries = v.get_if<value_map>();
        if (!entries) [[unlikely]]
            throw ctx.mismatch("a map", v);
        nesting_scope nesting { ctx };
        for (size_t i = 0; i < entries->size(); ++i) {
            const auto &[key, val] = (*entries)[i];
            const auto prev_size = ctx.path.size();
            fmt::format_to(std::back_inserter(ctx.path), "{{#{}}}.key", i);
            auto k = cbor::project<key_type>(key, ctx);
            ctx.path.resize(prev_size);
            format_map_segment(ctx.path, key, i);
            auto m = cbor::project<mapped_type>(val, ctx);
            observer(std::move(k), std::move(m));
            ctx.path.resize(prev_size);
        }
    }

    template<map_like M>
    struct projector<M> {
        static M project(const value &v, projection_context &ctx)
        {
            M res {};
            project_map_entries<M>(v, ctx, [&](auto &&k, auto &&m) {
                auto [it, created] = res.try_emplace(std::move(k), std::move(m));
                if (!created) {
                    if (ctx.cfg.duplicate_keys == duplicate_key_policy::reject) [[unlikely]]
                        throw ctx.fail(error_kind::duplicate_key, "the key has already been seen");
                    it->second = std::move(m);
                }
            });
            return res;
        }
    };

    template<typename K, typename V>
    struct projector<map_entries<K, V>> {
        static map_entries<K, V> project(const value &v, projection_context &ctx)
        {
            map_entries<K, V> res {};
            project_map_entries<map_entries<K, V>>(v, ctx, [&](auto &&k, auto &&m) {
                res.emplace_back(std::move(k), std::move(m));
            });
            return res;
        }
    };
}

namespace fmt {
    template<typename T>
    struct formatter<typed_cbor::cbor::tagged<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}({})", v.id, v.val);
        }
    };

    template<typename K, typename V>
    struct formatter<typed_cbor::cbor::map_entries<K, V>>: formatter<std::vector<std::pair<K, V>>> {
    };
}

#endif // !TYPED_CBOR_CBOR_PROJECTOR_HPP
