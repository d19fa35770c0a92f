/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ranges>
#include <lc/ledger/pending-table.hpp>

namespace ledger_core::ledger {
    void pending_table::extend(const account_nonce next_nonce, const transaction &tx)
    {
        if (next_nonce > tx.nonce()) [[unlikely]]
            throw consistency_error(fmt::format("pending table: cannot extend account {} at next nonce {} with an executed nonce {}",
                tx.sender(), next_nonce, tx.nonce()));
        checked_extend(next_nonce, tx);
    }

    void pending_table::checked_extend(const account_nonce next_nonce, const transaction &tx)
    {
        if (next_nonce > tx.nonce())
            return;
        const auto [it, created] = try_emplace(tx.sender(), nonce_range { next_nonce, tx.nonce() });
        if (!created)
            it->second.high = std::max(it->second.high, tx.nonce());
    }

    void pending_table::forward(const vector<transaction_ptr> &txs)
    {
        pending_table res = *this;
        for (const auto &tx: txs) {
            const auto it = res.find(tx->sender());
            if (it == res.end()) [[unlikely]]
                throw consistency_error(fmt::format("pending table: forwarding {} that is not pending", tx->hash()));
            auto &range = it->second;
            if (range.next != tx->nonce() || range.next > range.high) [[unlikely]]
                throw consistency_error(fmt::format("pending table: forwarding {} with nonce {} while account {} has the pending range {}",
                    tx->hash(), tx->nonce(), tx->sender(), range));
            if (range.next == range.high)
                res.erase(it);
            else
                ++range.next;
        }
        swap(res);
    }

    void pending_table::reverse(const vector<transaction_ptr> &txs)
    {
        pending_table res = *this;
        for (const auto &tx: txs | std::views::reverse) {
            const auto [it, created] = res.try_emplace(tx->sender(), nonce_range { tx->nonce(), tx->nonce() });
            if (created)
                continue;
            auto &range = it->second;
            if (range.next != tx->nonce() + 1) [[unlikely]]
                throw consistency_error(fmt::format("pending table: reversing {} with nonce {} while account {} has the pending range {}",
                    tx->hash(), tx->nonce(), tx->sender(), range));
            --range.next;
        }
        swap(res);
    }
}
