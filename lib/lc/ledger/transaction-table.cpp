/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/transaction-table.hpp>

namespace ledger_core::ledger {
    transaction_table::insert_result transaction_table::add(const transaction_ptr &tx, const slot_no slot)
    {
        if (!tx) [[unlikely]]
            throw error("cannot add an empty transaction pointer to the transaction table");
        if (const auto it = _entries.find(tx->hash()); it != _entries.end())
            return { add_outcome::duplicate, it->second.tx };
        if (const auto acc_it = _accounts.find(tx->sender()); acc_it != _accounts.end() && tx->nonce() < acc_it->second.next_nonce)
            return { add_outcome::obsolete_nonce };
        _accounts[tx->sender()].transactions[tx->nonce()].emplace(tx->hash());
        _entries.try_emplace(tx->hash(), entry { tx, initial_status(slot) });
        logger::trace("transaction table: added {}", *tx);
        return { add_outcome::added, tx };
    }

    const transaction_table::entry *transaction_table::find(const tx_hash &hash) const
    {
        if (const auto it = _entries.find(hash); it != _entries.end())
            return &it->second;
        return nullptr;
    }

    bool transaction_table::known(const tx_hash &hash) const
    {
        return _entries.contains(hash) || _retired.contains(hash);
    }

    std::optional<transaction_status> transaction_table::status(const tx_hash &hash) const
    {
        if (const auto *e = find(hash); e)
            return e->status;
        return {};
    }

    void transaction_table::add_result(const tx_hash &hash, const block_hash &block, const slot_no slot, const transaction_index idx)
    {
        auto &e = _at(hash);
        e.status = ledger::add_result(block, slot, idx, e.status);
    }

    void transaction_table::mark_dead_result(const tx_hash &hash, const block_hash &block)
    {
        if (_retired.contains(hash))
            return;
        auto &e = _at(hash);
        e.status = ledger::mark_dead_result(block, e.status);
    }

    void transaction_table::finalize(const block_hash &block, const slot_no slot, const vector<tx_hash> &hashes)
    {
        // the whole batch is checked first so that a failure leaves the table unchanged
        unordered_map<account_address, account_nonce> expected {};
        for (const auto &hash: hashes) {
            const auto it = _entries.find(hash);
            if (it == _entries.end()) [[unlikely]]
                throw consistency_error(fmt::format("cannot finalize an unknown transaction {} in block {}", hash, block));
            const auto &tx = *it->second.tx;
            auto [exp_it, created] = expected.try_emplace(tx.sender(), min_nonce);
            if (created) {
                const auto acc_it = _accounts.find(tx.sender());
                if (acc_it == _accounts.end()) [[unlikely]]
                    throw consistency_error(fmt::format("no non-finalized transactions are recorded for account {}", tx.sender()));
                exp_it->second = acc_it->second.next_nonce;
            }
            if (tx.nonce() != exp_it->second) [[unlikely]]
                throw consistency_error(fmt::format("finalizing {} with nonce {} but the next nonce of account {} is {}",
                    hash, tx.nonce(), tx.sender(), exp_it->second));
            ++exp_it->second;
        }
        for (size_t idx = 0; idx < hashes.size(); ++idx) {
            const auto &hash = hashes[idx];
            auto &e = _entries.at(hash);
            e.status = finalize_status(block, slot, idx, e.status);
            const auto tx = e.tx;
            auto &acc = _accounts.at(tx->sender());
            if (const auto nonce_it = acc.transactions.find(tx->nonce()); nonce_it != acc.transactions.end()) {
                for (const auto &other: nonce_it->second) {
                    if (other != hash) {
                        logger::trace("transaction table: dropping {} superseded by {} with the same nonce", other, hash);
                        if (const auto other_it = _entries.find(other); other_it != _entries.end()) {
                            _retired.insert_or_assign(other, other_it->second.tx->header().expiry);
                            _entries.erase(other_it);
                        }
                    }
                }
                acc.transactions.erase(nonce_it);
            }
            acc.next_nonce = tx->nonce() + 1;
        }
    }

    size_t transaction_table::purge(const transaction_time now, const uint64_t keep_alive)
    {
        vector<tx_hash> victims {};
        for (const auto &[hash, e]: _entries) {
            if (!std::holds_alternative<tx_received>(e.status))
                continue;
            if (e.tx->header().expiry < now || e.tx->arrival() + keep_alive < now)
                victims.emplace_back(hash);
        }
        for (const auto &hash: victims)
            _erase(hash);
        if (!victims.empty())
            logger::debug("transaction table: purged {} transactions at time {}", victims.size(), now);
        // retired hashes are remembered for keep_alive seconds past their expiry
        std::erase_if(_retired, [&](const auto &item) { return item.second + keep_alive < now; });
        return victims.size();
    }

    const account_non_finalized *transaction_table::account(const account_address &addr) const
    {
        if (const auto it = _accounts.find(addr); it != _accounts.end())
            return &it->second;
        return nullptr;
    }

    account_nonce transaction_table::next_account_nonce(const account_address &addr) const
    {
        const auto *acc = account(addr);
        if (!acc)
            return min_nonce;
        if (acc->transactions.empty())
            return acc->next_nonce;
        return std::max(acc->next_nonce, acc->transactions.rbegin()->first + 1);
    }

    transaction_table::entry &transaction_table::_at(const tx_hash &hash)
    {
        if (const auto it = _entries.find(hash); it != _entries.end()) [[likely]]
            return it->second;
        throw consistency_error(fmt::format("unknown transaction {}", hash));
    }

    void transaction_table::_erase(const tx_hash &hash)
    {
        const auto it = _entries.find(hash);
        if (it == _entries.end())
            return;
        const auto &tx = *it->second.tx;
        if (const auto acc_it = _accounts.find(tx.sender()); acc_it != _accounts.end()) {
            auto &txs = acc_it->second.transactions;
            if (const auto nonce_it = txs.find(tx.nonce()); nonce_it != txs.end()) {
                nonce_it->second.erase(hash);
                if (nonce_it->second.empty())
                    txs.erase(nonce_it);
            }
        }
        _entries.erase(it);
    }
}
