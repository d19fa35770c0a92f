/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/parameters.hpp>
#include <lc/ledger/update-queue.hpp>
#include <lc/common/test.hpp>

using namespace ledger_core;
using namespace ledger_core::ledger;

namespace {
    using difficulty_queue = update_queue<election_difficulty>;

    vector<transaction_time> times(const difficulty_queue &q)
    {
        vector<transaction_time> res {};
        for (const auto &e: q.entries)
            res.emplace_back(e.effective_time);
        return res;
    }
}

suite ledger_update_queue_suite = [] {
    "ledger::update_queue"_test = [] {
        "empty"_test = [] {
            const difficulty_queue q {};
            expect(q.empty());
            test_same(min_update_sequence_number, q.next_sequence_number);
            test_same(std::string { "000000000000000100" }, to_hex(payload_bytes(q)));
        };
        "enqueue in order"_test = [] {
            difficulty_queue q {};
            q.enqueue(100, { 1 });
            q.enqueue(200, { 2 });
            test_same(vector<transaction_time> { 100, 200 }, times(q));
            test_same(3, q.next_sequence_number);
        };
        "enqueue supersedes later entries"_test = [] {
            difficulty_queue q {};
            q.enqueue(100, { 1 });
            q.enqueue(200, { 2 });
            q.enqueue(300, { 3 });
            q.enqueue(150, { 4 });
            test_same(vector<transaction_time> { 100, 150 }, times(q));
            test_same(4, q.entries.back().update.parts);
            test_same(5, q.next_sequence_number);
        };
        "enqueue at the same time replaces"_test = [] {
            difficulty_queue q {};
            q.enqueue(100, { 1 });
            q.enqueue(100, { 2 });
            test_same(1, q.size());
            test_same(2, q.entries.front().update.parts);
            test_same(3, q.next_sequence_number);
        };
        "enqueue earlier drops everything"_test = [] {
            difficulty_queue q {};
            q.enqueue(100, { 1 });
            q.enqueue(50, { 2 });
            test_same(vector<transaction_time> { 50 }, times(q));
            test_same(3, q.next_sequence_number);
        };
        "dequeue_due"_test = [] {
            difficulty_queue q {};
            q.enqueue(100, { 1 });
            q.enqueue(200, { 2 });
            q.enqueue(300, { 3 });
            expect(q.dequeue_due(99).empty());
            const auto due = q.dequeue_due(200);
            test_same(2, due.size());
            test_same(1, due[0].update.parts);
            test_same(2, due[1].update.parts);
            test_same(vector<transaction_time> { 300 }, times(q));
            // dequeuing does not touch the sequence number
            test_same(4, q.next_sequence_number);
        };
        "binary"_test = [] {
            difficulty_queue q {};
            q.enqueue(100, { 7 });
            const auto bytes = payload_bytes(q);
            test_same(std::string { "0000000000000002" "01" "0000000000000064" "00000007" "00" }, to_hex(bytes));
            codec::decoder dec { bytes };
            expect(difficulty_queue::from_bytes(dec) == q);
            expect(dec.empty());
        };
        "binary not ascending"_test = [] {
            codec::encoder enc {};
            enc.u64(3);
            enc.u8(1).u64(200).u32(1);
            enc.u8(1).u64(200).u32(2);
            enc.u8(0);
            codec::decoder dec { enc.data() };
            expect(throws<codec::decode_error>([&] { difficulty_queue::from_bytes(dec); }));
        };
        "binary invalid marker"_test = [] {
            codec::encoder enc {};
            enc.u64(1).u8(2);
            codec::decoder dec { enc.data() };
            expect(throws<codec::decode_error>([&] { difficulty_queue::from_bytes(dec); }));
        };
        "binary invalid payload"_test = [] {
            codec::encoder enc {};
            enc.u64(2).u8(1).u64(100).u32(fraction_denominator).u8(0);
            codec::decoder dec { enc.data() };
            expect(throws<codec::decode_error>([&] { difficulty_queue::from_bytes(dec); }));
        };
        "hash"_test = [] {
            difficulty_queue q1 {}, q2 {};
            test_same(q1.hash(), q2.hash());
            q1.enqueue(100, { 1 });
            expect(q1.hash() != q2.hash());
            q2.enqueue(100, { 1 });
            test_same(q1.hash(), q2.hash());
            q2.dequeue_due(100);
            expect(q1.hash() != q2.hash());
        };
        "json"_test = [] {
            difficulty_queue q {};
            q.enqueue(100, { 7 });
            q.enqueue(200, { 8 });
            const auto j = q.to_json();
            test_same(3, j.at("nextSequenceNumber").as_uint64());
            test_same(2, j.at("queue").as_array().size());
            test_same(7, j.at("queue").as_array().at(0).as_object().at("update").as_uint64());
            expect(difficulty_queue::from_json(j) == q);
        };
        "json not ascending"_test = [] {
            const auto j = json::parse(R"({ "nextSequenceNumber": 3, "queue": [
                { "effectiveTime": 200, "update": 1 }, { "effectiveTime": 100, "update": 2 } ] })");
            expect(throws([&] { difficulty_queue::from_json(j); }));
            expect(throws([] { difficulty_queue::from_json(json::parse("[]")); }));
        };
    };
};
