/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/config.hpp>
#include <lc/logger.hpp>

namespace ledger_core {
    static json::object parse_config(const std::string &path, const uint8_vector &raw)
    {
        try {
            auto jv = json::parse(raw.str());
            if (!jv.is_object())
                throw error("the top-level element must be an object");
            return std::move(jv.as_object());
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to parse configuration file {}", path), ex);
        }
    }

    config_file::config_file(const std::string &path)
        : _path { path }, _raw { file::read(path) }, _parsed { parse_config(path, _raw) }
    {
        logger::debug("loaded configuration file {}: {} bytes", _path, _raw.size());
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }
}
