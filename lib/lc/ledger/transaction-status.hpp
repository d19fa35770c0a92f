/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_TRANSACTION_STATUS_HPP
#define LEDGER_CORE_LEDGER_TRANSACTION_STATUS_HPP

#include <optional>
#include <variant>
#include <lc/json.hpp>
#include <lc/ledger/types.hpp>

namespace ledger_core::ledger {
    struct tx_received {
        slot_no slot = 0;

        bool operator==(const tx_received &o) const =default;
    };

    // a transaction included in one or more live candidate blocks; outcomes is never empty
    struct tx_committed {
        slot_no slot = 0;
        flat_map<block_hash, transaction_index> outcomes {};

        bool operator==(const tx_committed &o) const
        {
            return slot == o.slot && outcomes == o.outcomes;
        }
    };

    // terminal
    struct tx_finalized {
        slot_no slot = 0;
        block_hash block {};
        transaction_index index = 0;

        bool operator==(const tx_finalized &o) const =default;
    };

    using transaction_status = std::variant<tx_received, tx_committed, tx_finalized>;

    struct status_index {
        bool finalized = false;
        transaction_index index = 0;

        bool operator==(const status_index &o) const =default;
    };

    extern transaction_status initial_status(slot_no slot);
    extern slot_no status_slot(const transaction_status &st);
    extern transaction_status add_result(const block_hash &block, slot_no slot, transaction_index idx, const transaction_status &st);
    extern transaction_status mark_dead_result(const block_hash &block, const transaction_status &st);
    extern std::optional<status_index> get_transaction_index(const block_hash &block, const transaction_status &st);
    extern transaction_status finalize_status(const block_hash &block, slot_no slot, transaction_index idx, const transaction_status &st);
    extern json::object status_to_json(const transaction_status &st);
}

namespace fmt {
    template<>
    struct formatter<ledger_core::ledger::transaction_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace ledger_core::ledger;
            if (const auto *rcv = std::get_if<tx_received>(&v))
                return fmt::format_to(ctx.out(), "received(slot: {})", rcv->slot);
            if (const auto *cmt = std::get_if<tx_committed>(&v))
                return fmt::format_to(ctx.out(), "committed(slot: {}, outcomes: {})", cmt->slot, cmt->outcomes);
            const auto &fin = std::get<tx_finalized>(v);
            return fmt::format_to(ctx.out(), "finalized(slot: {}, block: {}, index: {})", fin.slot, fin.block, fin.index);
        }
    };

    template<>
    struct formatter<ledger_core::ledger::status_index>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "(finalized: {}, index: {})", v.finalized, v.index);
        }
    };
}

#endif // !LEDGER_CORE_LEDGER_TRANSACTION_STATUS_HPP
