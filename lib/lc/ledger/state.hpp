/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_STATE_HPP
#define LEDGER_CORE_LEDGER_STATE_HPP

#include <lc/mutex.hpp>
#include <lc/ledger/pending-table.hpp>
#include <lc/ledger/settings.hpp>
#include <lc/ledger/transaction-table.hpp>
#include <lc/ledger/updates.hpp>

namespace ledger_core::ledger {
    struct block_info {
        block_hash hash {};
        slot_no slot = 0;
        // due update queue entries are applied against this time
        transaction_time timestamp = 0;
        vector<transaction_ptr> txs {};
        vector<update_instruction> update_instructions {};
    };

    enum class receive_result {
        added, duplicate, obsolete_nonce, invalid_signature, expired, expiry_too_far
    };

    struct block_result {
        processed_updates processed {};
        vector<enqueue_result> update_results {};
    };

    // Owns the transaction table, the pending table of the focus block, the live updates
    // and the stack of blocks applied on top of the last finalized one.
    // Writers are serialized by a unique lock, readers share a lock and get copies.
    // Every writer checks all preconditions before the first change so a failed call leaves no trace.
    struct state {
        explicit state(updates genesis, const settings &cfg = {});

        receive_result receive_transaction(const transaction_ptr &tx, const account_keys &keys, transaction_time now, slot_no slot);
        // records the block's outcomes without moving the focus, used for blocks of competing branches
        void commit_block(const block_info &blk);
        // executes the block on top of the focus block
        block_result apply_block(const block_info &blk);
        // only the focus block can be rolled back
        void rollback_block(const block_hash &hash);
        // the block is no longer live: it is not a descendant of the last finalized block
        void mark_dead(const block_info &blk);
        void finalize(const block_info &blk);
        size_t purge(transaction_time now);

        uint64_t version() const;
        size_t size() const;
        std::optional<transaction_status> status(const tx_hash &hash) const;
        std::optional<status_index> transaction_index_in(const block_hash &block, const tx_hash &hash) const;
        std::optional<nonce_range> pending_range(const account_address &addr) const;
        pending_table pending() const;
        account_nonce next_account_nonce(const account_address &addr) const;
        account_nonce focus_next_nonce(const account_address &addr) const;
        std::optional<block_hash> focus_block() const;
        updates current_updates() const;
        crypto::sha2::hash_256 updates_hash() const;
    private:
        struct applied_block {
            block_info block;
            updates prev_updates;
            unordered_map<account_address, account_nonce> prev_nonces {};
        };

        mutable mutex::shared_mutex _mutex {};
        const settings _settings;
        uint64_t _version = 0;
        transaction_table _txs {};
        pending_table _focus {};
        // the next nonce to execute of accounts that executed transactions in the applied blocks
        unordered_map<account_address, account_nonce> _focus_nonces {};
        updates _updates;
        vector<applied_block> _applied {};

        account_nonce _focus_next_nonce(const account_address &addr) const;
        // retired transactions are acceptable only when a block is being removed
        void _check_known(const block_info &blk, bool allow_retired=false) const;
        bool _is_applied(const block_hash &hash) const;
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_core::ledger::receive_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace ledger_core::ledger;
            switch (v) {
                case receive_result::added: return fmt::format_to(ctx.out(), "added");
                case receive_result::duplicate: return fmt::format_to(ctx.out(), "duplicate");
                case receive_result::obsolete_nonce: return fmt::format_to(ctx.out(), "obsolete_nonce");
                case receive_result::invalid_signature: return fmt::format_to(ctx.out(), "invalid_signature");
                case receive_result::expired: return fmt::format_to(ctx.out(), "expired");
                case receive_result::expiry_too_far: return fmt::format_to(ctx.out(), "expiry_too_far");
                default: throw ledger_core::error(fmt::format("unsupported receive_result value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !LEDGER_CORE_LEDGER_STATE_HPP
