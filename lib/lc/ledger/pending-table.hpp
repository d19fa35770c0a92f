/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_PENDING_TABLE_HPP
#define LEDGER_CORE_LEDGER_PENDING_TABLE_HPP

#include <lc/ledger/transaction.hpp>

namespace ledger_core::ledger {
    struct nonce_range {
        account_nonce next = min_nonce;
        account_nonce high = min_nonce;

        bool operator==(const nonce_range &o) const =default;
    };

    // For every account with pending transactions relative to a chosen block: the next nonce
    // to execute and the highest known pending nonce. Accounts with nothing pending are absent.
    struct pending_table: unordered_map<account_address, nonce_range> {
        using base_type = unordered_map<account_address, nonce_range>;
        using base_type::base_type;

        void extend(account_nonce next_nonce, const transaction &tx);
        // a no-op when the transaction's nonce has already been executed
        void checked_extend(account_nonce next_nonce, const transaction &tx);
        // the transactions have been executed in the given order
        void forward(const vector<transaction_ptr> &txs);
        // undoes forward of the same transactions
        void reverse(const vector<transaction_ptr> &txs);
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_core::ledger::nonce_range>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "({}, {})", v.next, v.high);
        }
    };
}

#endif // !LEDGER_CORE_LEDGER_PENDING_TABLE_HPP
