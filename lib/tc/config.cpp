/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tc/config.hpp>
#include <tc/logger.hpp>
#include <tc/narrow-cast.hpp>

namespace typed_cbor {
    duplicate_key_policy duplicate_key_policy_from_string(const std::string_view name)
    {
        if (name == "last-wins")
            return duplicate_key_policy::last_wins;
        if (name == "reject")
            return duplicate_key_policy::reject;
        throw error(fmt::format("unsupported duplicate key policy: '{}'", name));
    }

    static size_t size_from_json(const json::object &j, const std::string_view key)
    {
        const auto &v = j.at(key);
        switch (v.kind()) {
            case json::kind::uint64:
                return narrow_cast<size_t>(v.get_uint64());
            case json::kind::int64:
                return narrow_cast<size_t>(v.get_int64());
            default:
                throw error(fmt::format("config element {} must be a non-negative integer but got: {}", key, json::serialize(v)));
        }
    }

    decode_config decode_config::from_json(const json::object &j)
    {
        decode_config cfg {};
        try {
            if (j.contains("maxDepth"))
                cfg.max_depth = size_from_json(j, "maxDepth");
            if (j.contains("maxCollectionSize"))
                cfg.max_collection_size = size_from_json(j, "maxCollectionSize");
            if (j.contains("intToFloat")) {
                const auto &v = j.at("intToFloat");
                if (!v.is_bool()) [[unlikely]]
                    throw error(fmt::format("config element intToFloat must be a boolean but got: {}", json::serialize(v)));
                cfg.int_to_float = v.get_bool();
            }
            if (j.contains("duplicateKeys")) {
                const auto &v = j.at("duplicateKeys");
                if (!v.is_string()) [[unlikely]]
                    throw error(fmt::format("config element duplicateKeys must be a string but got: {}", json::serialize(v)));
                cfg.duplicate_keys = duplicate_key_policy_from_string(static_cast<std::string_view>(v.get_string()));
            }
        } catch (const error &) {
            throw;
        } catch (const std::exception &ex) {
            throw error("failed to interpret a decoder configuration", ex);
        }
        logger::debug("loaded {}", cfg);
        return cfg;
    }

    decode_config decode_config::from_file(const std::string &path)
    {
        json::value j {};
        try {
            j = json::load(path);
        } catch (const error &) {
            throw;
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to parse configuration file {}", path), ex);
        }
        if (!j.is_object()) [[unlikely]]
            throw error(fmt::format("configuration file {} must contain a JSON object", path));
        return from_json(j.get_object());
    }
}
