/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <thread>
#include <lc/ledger/test-data.hpp>
#include <lc/common/test.hpp>

using namespace ledger_core;
using namespace ledger_core::ledger;

namespace {
    state make_state(const settings &cfg={})
    {
        const auto g = test_data::sample_governance();
        return state { initial_updates(g.keys, test_data::sample_params()), cfg };
    }

    block_info make_block(const std::string_view name, const slot_no slot, vector<transaction_ptr> txs, const transaction_time ts=150)
    {
        return block_info { test_data::block(name), slot, ts, std::move(txs), {} };
    }

    void receive_all(state &st, const vector<transaction_ptr> &txs)
    {
        for (const auto &tx: txs) {
            const auto sender_id = tx->sender() == test_data::address(1) ? 1 : 2;
            test_same(receive_result::added, st.receive_transaction(tx, test_data::account_keys_of(sender_id), 100, 1));
        }
    }
}

suite ledger_state_suite = [] {
    "ledger::state"_test = [] {
        const auto addr1 = test_data::address(1);
        "receive"_test = [&] {
            auto st = make_state();
            const auto keys = test_data::account_keys_of(1);
            const auto tx = test_data::make_tx(1, 1);
            test_same(receive_result::added, st.receive_transaction(tx, keys, 100, 1));
            test_same(receive_result::duplicate, st.receive_transaction(tx, keys, 100, 1));
            test_same(1, st.size());
            test_same(nonce_range { 1, 1 }, *st.pending_range(addr1));
            test_same(2, st.next_account_nonce(addr1));
            test_same(1, st.focus_next_nonce(addr1));
            test_same(transaction_status { tx_received { 1 } }, *st.status(tx->hash()));
        };
        "receive rejections"_test = [&] {
            auto st = make_state(settings { 600, 1000 });
            const auto keys = test_data::account_keys_of(1);
            test_same(receive_result::expired, st.receive_transaction(test_data::make_tx(1, 1, 99), keys, 100, 1));
            test_same(receive_result::expiry_too_far, st.receive_transaction(test_data::make_tx(1, 1, 1101), keys, 100, 1));
            test_same(receive_result::added, st.receive_transaction(test_data::make_tx(1, 1, 1100), keys, 100, 1));
            test_same(receive_result::invalid_signature, st.receive_transaction(test_data::make_tx(1, 2), test_data::account_keys_of(2), 100, 1));
            test_same(1, st.size());
            expect(throws([&] { st.receive_transaction(nullptr, keys, 100, 1); }));
        };
        "apply and rollback"_test = [&] {
            auto st = make_state();
            const auto t1 = test_data::make_tx(1, 1);
            const auto t2 = test_data::make_tx(1, 2);
            receive_all(st, { t1, t2 });
            test_same(nonce_range { 1, 2 }, *st.pending_range(addr1));
            const auto pending_before = st.pending();
            const auto updates_before = st.updates_hash();
            const auto b1 = make_block("B1", 5, { t1 });
            st.apply_block(b1);
            test_same(b1.hash, *st.focus_block());
            test_same(nonce_range { 2, 2 }, *st.pending_range(addr1));
            test_same(2, st.focus_next_nonce(addr1));
            test_same(status_index { false, 0 }, *st.transaction_index_in(b1.hash, t1->hash()));
            st.rollback_block(b1.hash);
            expect(!st.focus_block());
            expect(st.pending() == pending_before);
            test_same(updates_before, st.updates_hash());
            test_same(1, st.focus_next_nonce(addr1));
            test_same(transaction_status { tx_received { 5 } }, *st.status(t1->hash()));
            expect(!st.transaction_index_in(b1.hash, t1->hash()));
        };
        "receive after apply"_test = [&] {
            auto st = make_state();
            const auto t1 = test_data::make_tx(1, 1);
            receive_all(st, { t1 });
            st.apply_block(make_block("B1", 5, { t1 }));
            expect(!st.pending_range(addr1));
            receive_all(st, { test_data::make_tx(1, 2) });
            test_same(nonce_range { 2, 2 }, *st.pending_range(addr1));
        };
        "competing blocks and finalization"_test = [&] {
            auto st = make_state();
            const auto t1 = test_data::make_tx(1, 1);
            const auto t2 = test_data::make_tx(2, 1);
            receive_all(st, { t1, t2 });
            const auto b1 = make_block("B1", 5, { t1, t2 });
            const auto b2 = make_block("B2", 5, { t2 });
            st.commit_block(b2);
            // the focus is unaffected by the competing block
            test_same(nonce_range { 1, 1 }, *st.pending_range(test_data::address(2)));
            st.apply_block(b1);
            test_same(status_index { false, 1 }, *st.transaction_index_in(b1.hash, t2->hash()));
            test_same(status_index { false, 0 }, *st.transaction_index_in(b2.hash, t2->hash()));
            expect(!st.pending_range(test_data::address(2)));
            st.finalize(b1);
            test_same(transaction_status { tx_finalized { 5, b1.hash, 1 } }, *st.status(t2->hash()));
            test_same(status_index { true, 1 }, *st.transaction_index_in(b1.hash, t2->hash()));
            expect(!st.transaction_index_in(b2.hash, t2->hash()));
            st.mark_dead(b2);
            test_same(transaction_status { tx_finalized { 5, b1.hash, 1 } }, *st.status(t2->hash()));
            // finalized blocks cannot be rolled back
            expect(throws<consistency_error>([&] { st.rollback_block(b1.hash); }));
        };
        "dead sibling with a finalized competitor"_test = [&] {
            auto st = make_state();
            const auto t1a = test_data::make_tx(1, 1, 1000, "t1a");
            const auto t1b = test_data::make_tx(1, 1, 1000, "t1b");
            const auto t2 = test_data::make_tx(2, 1);
            receive_all(st, { t1a, t1b, t2 });
            const auto b1 = make_block("B1", 5, { t1b });
            const auto b2 = make_block("B2", 6, { t1a, t2 });
            st.commit_block(b2);
            st.apply_block(b1);
            st.finalize(b1);
            expect(!st.status(t1a->hash()));
            const auto version = st.version();
            expect(nothrow([&] { st.mark_dead(b2); }));
            test_same(version + 1, st.version());
            test_same(transaction_status { tx_received { 6 } }, *st.status(t2->hash()));
            test_same(transaction_status { tx_finalized { 5, b1.hash, 0 } }, *st.status(t1b->hash()));
            // transactions that were never received are still a fault
            expect(throws<consistency_error>([&] { st.mark_dead(make_block("B3", 7, { test_data::make_tx(3, 1) })); }));
        };
        "rollback with a finalized competitor"_test = [&] {
            auto st = make_state(settings { 60, 7200 });
            const auto t1a = test_data::make_tx(1, 1, 1000, "t1a");
            const auto t1b = test_data::make_tx(1, 1, 1000, "t1b");
            const auto t2 = test_data::make_tx(2, 1);
            receive_all(st, { t1a, t1b, t2 });
            const auto b1 = make_block("B1", 5, { t2, t1b });
            const auto b2 = make_block("B2", 6, { t1a });
            st.apply_block(b1);
            st.commit_block(b2);
            st.finalize(b2);
            expect(!st.status(t1b->hash()));
            test_same(b1.hash, *st.focus_block());
            {
                // once the dropped competitor is forgotten the rollback fails without changes
                auto failing = make_state(settings { 60, 7200 });
                receive_all(failing, { t1a, t1b, t2 });
                failing.apply_block(b1);
                failing.commit_block(b2);
                failing.finalize(b2);
                failing.purge(1061);
                const auto version = failing.version();
                const auto pending = failing.pending();
                expect(throws<consistency_error>([&] { failing.rollback_block(b1.hash); }));
                test_same(version, failing.version());
                expect(failing.pending() == pending);
                test_same(b1.hash, *failing.focus_block());
                test_same(transaction_status { tx_committed { 5, { { b1.hash, 0 } } } }, *failing.status(t2->hash()));
                test_same(transaction_status { tx_finalized { 6, b2.hash, 0 } }, *failing.status(t1a->hash()));
            }
            expect(nothrow([&] { st.rollback_block(b1.hash); }));
            expect(!st.focus_block());
            test_same(transaction_status { tx_received { 5 } }, *st.status(t2->hash()));
            test_same(transaction_status { tx_finalized { 6, b2.hash, 0 } }, *st.status(t1a->hash()));
        };
        "mark dead"_test = [&] {
            auto st = make_state();
            const auto t1 = test_data::make_tx(1, 1);
            receive_all(st, { t1 });
            const auto b1 = make_block("B1", 5, { t1 });
            const auto b2 = make_block("B2", 6, { t1 });
            st.commit_block(b2);
            st.apply_block(b1);
            expect(throws<consistency_error>([&] { st.mark_dead(b1); }));
            st.mark_dead(b2);
            expect(!st.transaction_index_in(b2.hash, t1->hash()));
            test_same(status_index { false, 0 }, *st.transaction_index_in(b1.hash, t1->hash()));
        };
        "consistency faults leave no trace"_test = [&] {
            auto st = make_state();
            const auto t1 = test_data::make_tx(1, 1);
            const auto t2 = test_data::make_tx(1, 2);
            const auto t3 = test_data::make_tx(1, 3);
            receive_all(st, { t1, t3 });
            const auto version = st.version();
            const auto pending = st.pending();
            // unknown transaction
            expect(throws<consistency_error>([&] { st.apply_block(make_block("B1", 5, { t1, t2 })); }));
            // a nonce gap
            expect(throws<consistency_error>([&] { st.apply_block(make_block("B1", 5, { t1, t3 })); }));
            expect(throws<consistency_error>([&] { st.rollback_block(test_data::block("B1")); }));
            expect(throws<consistency_error>([&] { st.commit_block(make_block("B1", 5, { t2 })); }));
            test_same(version, st.version());
            expect(st.pending() == pending);
            test_same(transaction_status { tx_received { 1 } }, *st.status(t1->hash()));
            expect(!st.focus_block());
            const auto b1 = make_block("B1", 5, { t1 });
            st.apply_block(b1);
            expect(throws<consistency_error>([&] { st.apply_block(b1); }));
        };
        "rollback only the focus block"_test = [&] {
            auto st = make_state();
            const auto t1 = test_data::make_tx(1, 1);
            const auto t2 = test_data::make_tx(1, 2);
            receive_all(st, { t1, t2 });
            const auto b1 = make_block("B1", 5, { t1 });
            const auto b2 = make_block("B2", 6, { t2 });
            st.apply_block(b1);
            st.apply_block(b2);
            expect(!st.pending_range(addr1));
            expect(throws<consistency_error>([&] { st.rollback_block(b1.hash); }));
            st.rollback_block(b2.hash);
            st.rollback_block(b1.hash);
            test_same(nonce_range { 1, 2 }, *st.pending_range(addr1));
        };
        "update instructions"_test = [&] {
            const auto g = test_data::sample_governance();
            auto st = make_state();
            const auto genesis_hash = st.updates_hash();
            auto b1 = make_block("B1", 5, {}, 100);
            b1.update_instructions.emplace_back(sign_update_instruction(g.level2_signers({ 0 }), 1, 200, 0,
                update_payload_value { update_type::election_difficulty, election_difficulty { 4'000 } }));
            b1.update_instructions.emplace_back(sign_update_instruction(g.level2_signers({ 2 }), 1, 200, 0,
                update_payload_value { update_type::gas_rewards, gas_rewards { 1, 1, 1, 1 } }));
            const auto res = st.apply_block(b1);
            test_same(2, res.update_results.size());
            test_same(enqueue_result::ok, res.update_results.at(0));
            test_same(enqueue_result::unauthorized, res.update_results.at(1));
            expect(st.updates_hash() != genesis_hash);
            test_same(2, st.current_updates().next_sequence_number(update_type::election_difficulty));
            const auto b2 = make_block("B2", 6, {}, 250);
            st.apply_block(b2);
            test_same(4'000, st.current_updates().params.difficulty.parts);
            st.rollback_block(b2.hash);
            test_same(test_data::sample_params().difficulty.parts, st.current_updates().params.difficulty.parts);
            st.rollback_block(b1.hash);
            test_same(genesis_hash, st.updates_hash());
        };
        "purge"_test = [&] {
            auto st = make_state(settings { 60, 7200 });
            const auto keys = test_data::account_keys_of(1);
            const auto t1 = test_data::make_tx(1, 1, 1000, "t1", 100);
            test_same(receive_result::added, st.receive_transaction(t1, keys, 100, 1));
            test_same(0, st.purge(150));
            test_same(1, st.purge(161));
            expect(!st.status(t1->hash()));
            test_same(0, st.size());
        };
        "concurrent receivers"_test = [&] {
            auto st = make_state();
            static constexpr size_t num_workers = 4;
            static constexpr size_t txs_per_worker = 8;
            vector<std::thread> workers {};
            for (size_t w = 0; w < num_workers; ++w) {
                workers.emplace_back([&st, w] {
                    const auto sender = static_cast<uint8_t>(10 + w);
                    const auto keys = test_data::account_keys_of(sender);
                    for (size_t i = 0; i < txs_per_worker; ++i) {
                        st.receive_transaction(test_data::make_tx(sender, i + 1), keys, 100, 1);
                        st.size();
                    }
                });
            }
            for (auto &t: workers)
                t.join();
            test_same(num_workers * txs_per_worker, st.size());
            for (size_t w = 0; w < num_workers; ++w)
                test_same(nonce_range { 1, txs_per_worker }, *st.pending_range(test_data::address(static_cast<uint8_t>(10 + w))));
        };
    };
};
