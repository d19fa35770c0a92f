/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <lc/ledger/state.hpp>

namespace ledger_core::ledger {
    state::state(updates genesis, const settings &cfg): _settings { cfg }, _updates { std::move(genesis) }
    {
        logger::debug("ledger state: created with updates {}", _updates.hash());
    }

    receive_result state::receive_transaction(const transaction_ptr &tx, const account_keys &keys, const transaction_time now, const slot_no slot)
    {
        if (!tx) [[unlikely]]
            throw error("cannot receive an empty transaction pointer");
        const auto expiry = tx->header().expiry;
        if (expiry < now)
            return receive_result::expired;
        if (expiry > now + _settings.max_time_to_expiry)
            return receive_result::expiry_too_far;
        if (!verify_transaction(keys, *tx))
            return receive_result::invalid_signature;
        mutex::write_lock lk { _mutex };
        const auto res = _txs.add(tx, slot);
        switch (res.outcome) {
            case add_outcome::added:
                _focus.checked_extend(_focus_next_nonce(tx->sender()), *tx);
                ++_version;
                return receive_result::added;
            case add_outcome::duplicate:
                return receive_result::duplicate;
            case add_outcome::obsolete_nonce:
                return receive_result::obsolete_nonce;
            default:
                throw error(fmt::format("unsupported add_outcome: {}", res.outcome));
        }
    }

    void state::commit_block(const block_info &blk)
    {
        mutex::write_lock lk { _mutex };
        _check_known(blk);
        for (size_t i = 0; i < blk.txs.size(); ++i)
            _txs.add_result(blk.txs[i]->hash(), blk.hash, blk.slot, i);
        ++_version;
        logger::debug("ledger state: committed block {} with {} transactions", blk.hash, blk.txs.size());
    }

    block_result state::apply_block(const block_info &blk)
    {
        mutex::write_lock lk { _mutex };
        if (_is_applied(blk.hash)) [[unlikely]]
            throw consistency_error(fmt::format("block {} has already been applied", blk.hash));
        _check_known(blk);
        for (const auto &tx: blk.txs) {
            if (std::holds_alternative<tx_finalized>(_txs.find(tx->hash())->status)) [[unlikely]]
                throw consistency_error(fmt::format("block {} executes {} which has already been finalized", blk.hash, tx->hash()));
        }
        pending_table next_focus = _focus;
        next_focus.forward(blk.txs);
        auto next_updates = _updates;
        block_result res {};
        res.processed = next_updates.process_due(blk.timestamp);
        res.update_results.reserve(blk.update_instructions.size());
        for (const auto &instr: blk.update_instructions)
            res.update_results.emplace_back(next_updates.enqueue_update(instr));

        applied_block undo { blk, std::move(_updates) };
        for (size_t i = 0; i < blk.txs.size(); ++i) {
            const auto &tx = *blk.txs[i];
            _txs.add_result(tx.hash(), blk.hash, blk.slot, i);
            undo.prev_nonces.try_emplace(tx.sender(), _focus_next_nonce(tx.sender()));
            _focus_nonces.insert_or_assign(tx.sender(), tx.nonce() + 1);
        }
        _applied.emplace_back(std::move(undo));
        _focus.swap(next_focus);
        _updates = std::move(next_updates);
        ++_version;
        logger::debug("ledger state: applied block {} at slot {} with {} transactions and {} update instructions",
            blk.hash, blk.slot, blk.txs.size(), blk.update_instructions.size());
        return res;
    }

    void state::rollback_block(const block_hash &hash)
    {
        mutex::write_lock lk { _mutex };
        if (_applied.empty() || _applied.back().block.hash != hash) [[unlikely]]
            throw consistency_error(fmt::format("block {} is not the focus block and cannot be rolled back", hash));
        auto &undo = _applied.back();
        _check_known(undo.block, true);
        pending_table next_focus = _focus;
        next_focus.reverse(undo.block.txs);
        for (const auto &tx: undo.block.txs)
            _txs.mark_dead_result(tx->hash(), hash);
        for (const auto &[addr, nonce]: undo.prev_nonces)
            _focus_nonces.insert_or_assign(addr, nonce);
        _focus.swap(next_focus);
        _updates = std::move(undo.prev_updates);
        _applied.pop_back();
        ++_version;
        logger::debug("ledger state: rolled back block {}", hash);
    }

    void state::mark_dead(const block_info &blk)
    {
        mutex::write_lock lk { _mutex };
        if (_is_applied(blk.hash)) [[unlikely]]
            throw consistency_error(fmt::format("block {} is in the focus branch and must be rolled back before being marked dead", blk.hash));
        _check_known(blk, true);
        for (const auto &tx: blk.txs)
            _txs.mark_dead_result(tx->hash(), blk.hash);
        ++_version;
        logger::debug("ledger state: marked block {} dead", blk.hash);
    }

    void state::finalize(const block_info &blk)
    {
        mutex::write_lock lk { _mutex };
        vector<tx_hash> hashes {};
        hashes.reserve(blk.txs.size());
        for (const auto &tx: blk.txs)
            hashes.emplace_back(tx->hash());
        _txs.finalize(blk.hash, blk.slot, hashes);
        // finalized blocks can no longer be rolled back
        if (const auto it = std::find_if(_applied.begin(), _applied.end(), [&](const auto &ab) { return ab.block.hash == blk.hash; }); it != _applied.end())
            _applied.erase(_applied.begin(), std::next(it));
        ++_version;
        logger::info("ledger state: finalized block {} at slot {} with {} transactions", blk.hash, blk.slot, blk.txs.size());
    }

    size_t state::purge(const transaction_time now)
    {
        mutex::write_lock lk { _mutex };
        const auto num_purged = _txs.purge(now, _settings.transaction_keep_alive);
        if (num_purged)
            ++_version;
        return num_purged;
    }

    uint64_t state::version() const
    {
        mutex::read_lock lk { _mutex };
        return _version;
    }

    size_t state::size() const
    {
        mutex::read_lock lk { _mutex };
        return _txs.size();
    }

    std::optional<transaction_status> state::status(const tx_hash &hash) const
    {
        mutex::read_lock lk { _mutex };
        return _txs.status(hash);
    }

    std::optional<status_index> state::transaction_index_in(const block_hash &block, const tx_hash &hash) const
    {
        mutex::read_lock lk { _mutex };
        if (const auto *e = _txs.find(hash); e)
            return get_transaction_index(block, e->status);
        return {};
    }

    std::optional<nonce_range> state::pending_range(const account_address &addr) const
    {
        mutex::read_lock lk { _mutex };
        if (const auto it = _focus.find(addr); it != _focus.end())
            return it->second;
        return {};
    }

    pending_table state::pending() const
    {
        mutex::read_lock lk { _mutex };
        return _focus;
    }

    account_nonce state::next_account_nonce(const account_address &addr) const
    {
        mutex::read_lock lk { _mutex };
        return _txs.next_account_nonce(addr);
    }

    account_nonce state::focus_next_nonce(const account_address &addr) const
    {
        mutex::read_lock lk { _mutex };
        return _focus_next_nonce(addr);
    }

    std::optional<block_hash> state::focus_block() const
    {
        mutex::read_lock lk { _mutex };
        if (_applied.empty())
            return {};
        return _applied.back().block.hash;
    }

    updates state::current_updates() const
    {
        mutex::read_lock lk { _mutex };
        return _updates;
    }

    crypto::sha2::hash_256 state::updates_hash() const
    {
        mutex::read_lock lk { _mutex };
        return _updates.hash();
    }

    account_nonce state::_focus_next_nonce(const account_address &addr) const
    {
        if (const auto it = _focus_nonces.find(addr); it != _focus_nonces.end())
            return it->second;
        if (const auto *acc = _txs.account(addr); acc)
            return acc->next_nonce;
        return min_nonce;
    }

    void state::_check_known(const block_info &blk, const bool allow_retired) const
    {
        for (const auto &tx: blk.txs) {
            if (!tx) [[unlikely]]
                throw consistency_error(fmt::format("block {} contains an empty transaction pointer", blk.hash));
            if (!(allow_retired ? _txs.known(tx->hash()) : _txs.find(tx->hash()) != nullptr)) [[unlikely]]
                throw consistency_error(fmt::format("block {} contains an unknown transaction {}", blk.hash, tx->hash()));
        }
    }

    bool state::_is_applied(const block_hash &hash) const
    {
        return std::any_of(_applied.begin(), _applied.end(), [&](const auto &ab) { return ab.block.hash == hash; });
    }
}
