/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cli/common.hpp>

namespace ledger_core::cli::common {
    ledger::updates load_updates(const std::string &path)
    {
        const auto j = json::load(path);
        if (j.is_object() && j.get_object().contains("updateKeys"))
            return ledger::updates::from_genesis_json(j);
        return ledger::updates::from_json(j);
    }

    void print_updates(const ledger::updates &upd)
    {
        std::cout << fmt::format("updates hash: {}\n", upd.hash());
        std::cout << fmt::format("keys hash: {}\n", upd.keys.hash());
        if (const auto status = upd.protocol_status(); std::holds_alternative<ledger::protocol_updated>(status)) {
            std::cout << fmt::format("protocol update in effect: {}\n", std::get<ledger::protocol_updated>(status).update.message);
        } else {
            const auto &pending = std::get<ledger::pending_protocol_updates>(status);
            std::cout << fmt::format("pending protocol updates: {}\n", pending.updates.size());
        }
        upd.pending.foreach_queue([](const std::string_view name, const auto &q) {
            std::cout << fmt::format("queue {}: next sequence number: {} pending: {}\n", name, q.next_sequence_number, q.size());
        });
    }
}
