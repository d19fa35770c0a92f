/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_TRANSACTION_TABLE_HPP
#define LEDGER_CORE_LEDGER_TRANSACTION_TABLE_HPP

#include <lc/ledger/transaction.hpp>
#include <lc/ledger/transaction-status.hpp>

namespace ledger_core::ledger {
    // Non-finalized transactions of a single account grouped by nonce.
    // Every key is at least next_nonce, the smallest nonce not yet finalized.
    struct account_non_finalized {
        map<account_nonce, flat_set<tx_hash>> transactions {};
        account_nonce next_nonce = min_nonce;
    };

    enum class add_outcome {
        added, duplicate, obsolete_nonce
    };

    struct transaction_table {
        struct entry {
            transaction_ptr tx {};
            transaction_status status {};
        };

        struct insert_result {
            add_outcome outcome;
            transaction_ptr tx {};
        };

        insert_result add(const transaction_ptr &tx, slot_no slot);
        const entry *find(const tx_hash &hash) const;
        // present in the table or dropped because a competitor with the same nonce has been finalized
        bool known(const tx_hash &hash) const;
        std::optional<transaction_status> status(const tx_hash &hash) const;
        void add_result(const tx_hash &hash, const block_hash &block, slot_no slot, transaction_index idx);
        // a no-op for transactions dropped in favor of a finalized competitor
        void mark_dead_result(const tx_hash &hash, const block_hash &block);
        void finalize(const block_hash &block, slot_no slot, const vector<tx_hash> &hashes);
        size_t purge(transaction_time now, uint64_t keep_alive);
        const account_non_finalized *account(const account_address &addr) const;
        account_nonce next_account_nonce(const account_address &addr) const;

        size_t size() const noexcept
        {
            return _entries.size();
        }
    private:
        unordered_map<tx_hash, entry> _entries {};
        unordered_map<account_address, account_non_finalized> _accounts {};
        // hashes dropped by finalization mapped to their expiry, blocks of dead branches may still reference them
        unordered_map<tx_hash, transaction_time> _retired {};

        entry &_at(const tx_hash &hash);
        void _erase(const tx_hash &hash);
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_core::ledger::add_outcome>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace ledger_core::ledger;
            switch (v) {
                case add_outcome::added: return fmt::format_to(ctx.out(), "added");
                case add_outcome::duplicate: return fmt::format_to(ctx.out(), "duplicate");
                case add_outcome::obsolete_nonce: return fmt::format_to(ctx.out(), "obsolete_nonce");
                default: throw ledger_core::error(fmt::format("unsupported add_outcome value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !LEDGER_CORE_LEDGER_TRANSACTION_TABLE_HPP
