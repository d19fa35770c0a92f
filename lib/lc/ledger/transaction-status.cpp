/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/transaction-status.hpp>

namespace ledger_core::ledger {
    transaction_status initial_status(const slot_no slot)
    {
        return tx_received { slot };
    }

    slot_no status_slot(const transaction_status &st)
    {
        return std::visit([](const auto &s) { return s.slot; }, st);
    }

    transaction_status add_result(const block_hash &block, const slot_no slot, const transaction_index idx, const transaction_status &st)
    {
        if (const auto *rcv = std::get_if<tx_received>(&st)) {
            tx_committed cmt { std::max(rcv->slot, slot) };
            cmt.outcomes.emplace(block, idx);
            return cmt;
        }
        if (const auto *cmt = std::get_if<tx_committed>(&st)) {
            tx_committed res { std::max(cmt->slot, slot), cmt->outcomes };
            res.outcomes.insert_or_assign(block, idx);
            return res;
        }
        return st;
    }

    transaction_status mark_dead_result(const block_hash &block, const transaction_status &st)
    {
        if (const auto *cmt = std::get_if<tx_committed>(&st)) {
            tx_committed res = *cmt;
            res.outcomes.erase(block);
            if (res.outcomes.empty())
                return tx_received { res.slot };
            return res;
        }
        return st;
    }

    std::optional<status_index> get_transaction_index(const block_hash &block, const transaction_status &st)
    {
        if (const auto *cmt = std::get_if<tx_committed>(&st)) {
            if (const auto it = cmt->outcomes.find(block); it != cmt->outcomes.end())
                return status_index { false, it->second };
            return {};
        }
        if (const auto *fin = std::get_if<tx_finalized>(&st); fin && fin->block == block)
            return status_index { true, fin->index };
        return {};
    }

    transaction_status finalize_status(const block_hash &block, const slot_no slot, const transaction_index idx, const transaction_status &st)
    {
        if (const auto *fin = std::get_if<tx_finalized>(&st)) {
            if (fin->block != block || fin->index != idx) [[unlikely]]
                throw consistency_error(fmt::format("a transaction finalized in block {} at index {} cannot be finalized again in block {} at index {}",
                    fin->block, fin->index, block, idx));
            return st;
        }
        return tx_finalized { slot, block, idx };
    }

    json::object status_to_json(const transaction_status &st)
    {
        if (const auto *rcv = std::get_if<tx_received>(&st)) {
            return json::object {
                { "status", "received" },
                { "slot", rcv->slot }
            };
        }
        if (const auto *cmt = std::get_if<tx_committed>(&st)) {
            json::object outcomes {};
            for (const auto &[block, idx]: cmt->outcomes)
                outcomes.emplace(to_hex(block), idx);
            return json::object {
                { "status", "committed" },
                { "slot", cmt->slot },
                { "outcomes", std::move(outcomes) }
            };
        }
        const auto &fin = std::get<tx_finalized>(st);
        return json::object {
            { "status", "finalized" },
            { "slot", fin.slot },
            { "blockHash", to_hex(fin.block) },
            { "index", fin.index }
        };
    }
}
