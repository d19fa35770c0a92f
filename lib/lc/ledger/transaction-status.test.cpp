/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/test-data.hpp>
#include <lc/common/test.hpp>

using namespace ledger_core;
using namespace ledger_core::ledger;

suite ledger_transaction_status_suite = [] {
    "ledger::transaction_status"_test = [] {
        const auto b1 = test_data::block("B1");
        const auto b2 = test_data::block("B2");
        "received"_test = [] {
            const auto st = initial_status(5);
            expect(std::holds_alternative<tx_received>(st));
            test_same(5, status_slot(st));
        };
        "committed in two blocks"_test = [&] {
            auto st = add_result(b1, 10, 0, initial_status(5));
            st = add_result(b2, 11, 3, st);
            const auto &cmt = std::get<tx_committed>(st);
            test_same(11, cmt.slot);
            test_same(2, cmt.outcomes.size());
            test_same(status_index { false, 0 }, *get_transaction_index(b1, st));
            test_same(status_index { false, 3 }, *get_transaction_index(b2, st));
            expect(!get_transaction_index(test_data::block("B3"), st));
        };
        "slot never decreases"_test = [&] {
            auto st = add_result(b1, 3, 0, initial_status(8));
            test_same(8, status_slot(st));
            st = mark_dead_result(b1, st);
            expect(std::holds_alternative<tx_received>(st));
            test_same(8, status_slot(st));
        };
        "mark dead"_test = [&] {
            auto st = add_result(b2, 11, 3, add_result(b1, 10, 0, initial_status(5)));
            st = mark_dead_result(b1, st);
            expect(!get_transaction_index(b1, st));
            test_same(status_index { false, 3 }, *get_transaction_index(b2, st));
            st = mark_dead_result(b2, st);
            test_same(transaction_status { tx_received { 11 } }, st);
            // an unknown block changes nothing
            test_same(st, mark_dead_result(b1, st));
        };
        "finalize"_test = [&] {
            const auto cmt = add_result(b2, 11, 3, add_result(b1, 10, 0, initial_status(5)));
            const auto fin = finalize_status(b2, 11, 3, cmt);
            test_same(transaction_status { tx_finalized { 11, b2, 3 } }, fin);
            test_same(status_index { true, 3 }, *get_transaction_index(b2, fin));
            expect(!get_transaction_index(b1, fin));
            // finalized is terminal
            test_same(fin, add_result(b1, 20, 1, fin));
            test_same(fin, mark_dead_result(b2, fin));
            test_same(fin, finalize_status(b2, 11, 3, fin));
            expect(throws<consistency_error>([&] { finalize_status(b1, 10, 0, fin); }));
        };
        "finalize a received transaction"_test = [&] {
            const auto fin = finalize_status(b1, 12, 4, initial_status(5));
            test_same(transaction_status { tx_finalized { 12, b1, 4 } }, fin);
        };
        "json"_test = [&] {
            const auto rcv = status_to_json(initial_status(5));
            test_same(std::string_view { "received" }, json::as_str(rcv.at("status")));
            const auto cmt = status_to_json(add_result(b1, 10, 2, initial_status(5)));
            test_same(std::string_view { "committed" }, json::as_str(cmt.at("status")));
            test_same(2, cmt.at("outcomes").as_object().at(to_hex(b1)).as_uint64());
            const auto fin = status_to_json(finalize_status(b1, 10, 2, initial_status(5)));
            test_same(std::string_view { "finalized" }, json::as_str(fin.at("status")));
            test_same(to_hex(b1), std::string { json::as_str(fin.at("blockHash")) });
        };
    };
};
