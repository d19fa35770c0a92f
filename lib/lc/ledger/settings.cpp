/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/settings.hpp>

namespace ledger_core::ledger {
    settings settings::from_config(const config &cfg)
    {
        settings res {};
        if (cfg.find("transactionKeepAlive"))
            res.transaction_keep_alive = json::field_uint<uint64_t>(cfg.json(), "transactionKeepAlive");
        if (cfg.find("maxTimeToExpiry"))
            res.max_time_to_expiry = json::field_uint<uint64_t>(cfg.json(), "maxTimeToExpiry");
        logger::debug("ledger settings: transaction keep alive: {} sec max time to expiry: {} sec",
            res.transaction_keep_alive, res.max_time_to_expiry);
        return res;
    }

    json::object settings::to_json() const
    {
        return json::object {
            { "transactionKeepAlive", transaction_keep_alive },
            { "maxTimeToExpiry", max_time_to_expiry }
        };
    }
}
