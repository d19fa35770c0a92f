/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_SETTINGS_HPP
#define LEDGER_CORE_LEDGER_SETTINGS_HPP

#include <lc/config.hpp>
#include <lc/ledger/types.hpp>

namespace ledger_core::ledger {
    struct settings {
        // seconds a received but not committed transaction is kept in the table
        uint64_t transaction_keep_alive = 600;
        // the furthest in the future a transaction's expiry may be at the time of receipt
        uint64_t max_time_to_expiry = 7200;

        // missing elements keep their default values
        static settings from_config(const config &cfg);
        json::object to_json() const;
        bool operator==(const settings &o) const =default;
    };
}

#endif // !LEDGER_CORE_LEDGER_SETTINGS_HPP
