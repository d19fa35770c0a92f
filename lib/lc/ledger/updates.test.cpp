/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/test-data.hpp>
#include <lc/common/test.hpp>

using namespace ledger_core;
using namespace ledger_core::ledger;

namespace {
    update_instruction difficulty_update(const update_signing_key_list &signers, const update_sequence_number seq,
        const transaction_time effective_time, const uint32_t parts, const transaction_time timeout=0)
    {
        return sign_update_instruction(signers, seq, effective_time, timeout,
            update_payload_value { update_type::election_difficulty, election_difficulty { parts } });
    }

    update_instruction protocol_instruction(const test_data::governance &g, const update_sequence_number seq,
        const transaction_time effective_time, const std::string_view message)
    {
        return sign_update_instruction(g.level2_signers({ 0, 2 }), seq, effective_time, 0,
            update_payload_value { update_type::protocol, test_data::sample_protocol_update(message) });
    }
}

suite ledger_updates_suite = [] {
    "ledger::updates"_test = [] {
        const auto g = test_data::sample_governance();
        const auto params = test_data::sample_params();
        "initial"_test = [&] {
            const auto upd = initial_updates(g.keys, params);
            expect(upd.params == params);
            expect(upd.keys.keys() == g.keys);
            test_same(payload_hash(g.keys), upd.keys.hash());
            expect(!upd.current_protocol_update);
            upd.pending.foreach_queue([](const std::string_view name, const auto &q) {
                expect(q.empty()) << name;
                test_same(min_update_sequence_number, q.next_sequence_number);
            });
            const auto status = upd.protocol_status();
            expect(std::get<pending_protocol_updates>(status).updates.empty());
        };
        "enqueue"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            const auto hash_before = upd.hash();
            test_same(enqueue_result::ok, upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000)));
            test_same(2, upd.next_sequence_number(update_type::election_difficulty));
            test_same(1, upd.pending.election_difficulty_queue.size());
            test_same(1, upd.next_sequence_number(update_type::protocol));
            expect(upd.hash() != hash_before);
            // the parameters change only once the update becomes effective
            expect(upd.params == params);
        };
        "sequence number mismatch"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            test_same(enqueue_result::sequence_number_mismatch, upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 2, 1000, 5'000)));
            test_same(enqueue_result::ok, upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000)));
            test_same(enqueue_result::sequence_number_mismatch, upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000)));
            test_same(1, upd.pending.election_difficulty_queue.size());
        };
        "expired timeout"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            test_same(enqueue_result::expired_timeout, upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000, 1001)));
            test_same(enqueue_result::ok, upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000, 1000)));
        };
        "authorization"_test = [&] {
            const auto upd = initial_updates(g.keys, params);
            expect(upd.authorized(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000)));
            expect(upd.authorized(difficulty_update(g.level2_signers({ 1 }), 1, 1000, 5'000)));
            // key 2 is not part of the access structure for the election difficulty
            expect(!upd.authorized(difficulty_update(g.level2_signers({ 2 }), 1, 1000, 5'000)));
            expect(!upd.authorized(difficulty_update(g.level2_signers({ 0, 2 }), 1, 1000, 5'000)));
            // a signature by the wrong key under an allowed index
            expect(!upd.authorized(difficulty_update(g.level1_signers({ 0 }), 1, 1000, 5'000)));
            // the same index twice
            expect(!upd.authorized(difficulty_update(g.level2_signers({ 0, 0 }), 1, 1000, 5'000)));
            expect(!upd.authorized(difficulty_update({}, 1, 1000, 5'000)));
            // protocol updates need keys 0 and 2
            expect(!upd.authorized(sign_update_instruction(g.level2_signers({ 0 }), 1, 1000, 0,
                update_payload_value { update_type::protocol, test_data::sample_protocol_update() })));
            expect(upd.authorized(protocol_instruction(g, 1, 1000, "P2")));
        };
        "higher level key updates"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            const update_payload_value root_payload { update_type::root_keys, g.keys.root_keys };
            test_same(enqueue_result::unauthorized, upd.enqueue_update(sign_update_instruction(g.root_signers({ 0 }), 1, 100, 0, root_payload)));
            test_same(enqueue_result::ok, upd.enqueue_update(sign_update_instruction(g.root_signers({ 0, 1 }), 1, 100, 0, root_payload)));
            const update_payload_value level2_payload { update_type::level2_keys, g.keys.level2_keys };
            test_same(enqueue_result::unauthorized, upd.enqueue_update(sign_update_instruction(g.level2_signers({ 0 }), 1, 100, 0, level2_payload)));
            test_same(enqueue_result::ok, upd.enqueue_update(sign_update_instruction(g.level1_signers({ 1 }), 1, 100, 0, level2_payload)));
        };
        "process due parameters"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000));
            upd.enqueue_update(sign_update_instruction(g.level2_signers({ 1 }), 1, 2000, 0,
                update_payload_value { update_type::micro_gtu_per_euro, exchange_rate { 3, 4 } }));
            upd.enqueue_update(sign_update_instruction(g.level2_signers({ 1 }), 1, 500, 0,
                update_payload_value { update_type::baker_stake_threshold, baker_stake_threshold { 77 } }));
            const auto none = upd.process_due(499);
            expect(upd.params == params);
            expect(none.anonymity_revokers.empty());
            upd.process_due(1000);
            test_same(5'000, upd.params.difficulty.parts);
            test_same(77, upd.params.min_baker_stake);
            expect(upd.params.micro_gtu_per_euro == params.micro_gtu_per_euro);
            expect(upd.pending.election_difficulty_queue.empty());
            test_same(1, upd.pending.micro_gtu_per_euro_queue.size());
            upd.process_due(2000);
            expect(upd.params.micro_gtu_per_euro == exchange_rate { 3, 4 });
            // sequence numbers survive the processing
            test_same(2, upd.next_sequence_number(update_type::election_difficulty));
        };
        "process due in order"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 100, 1'000));
            upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 2, 200, 2'000));
            upd.process_due(300);
            test_same(2'000, upd.params.difficulty.parts);
        };
        "anonymity revokers and identity providers"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            const ar_info ar { 5, { "ar", "https://ar", "revoker" }, uint8_vector::from_hex("0A0B") };
            const ip_info ip { 6, { "ip", "https://ip", "provider" }, uint8_vector::from_hex("0C"), test_data::key_pair("ip-6").second };
            test_same(enqueue_result::ok, upd.enqueue_update(sign_update_instruction(g.level2_signers({ 0 }), 1, 100, 0,
                update_payload_value { update_type::add_anonymity_revoker, ar })));
            test_same(enqueue_result::ok, upd.enqueue_update(sign_update_instruction(g.level2_signers({ 1 }), 1, 100, 0,
                update_payload_value { update_type::add_identity_provider, ip })));
            const auto processed = upd.process_due(100);
            test_same(1, processed.anonymity_revokers.size());
            expect(processed.anonymity_revokers.at(0) == ar);
            test_same(1, processed.identity_providers.size());
            expect(processed.identity_providers.at(0) == ip);
            expect(upd.process_due(1000).identity_providers.empty());
        };
        "key rotation"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            const auto hash_before = upd.keys.hash();
            const auto new_l2 = test_data::key_pair("new-level2");
            auto auths = g.keys.level2_keys;
            auths.keys = { new_l2.second };
            auths.election_difficulty = access_structure { { 0 }, 1 };
            auths.emergency = auths.protocol = auths.euro_per_energy = auths.micro_gtu_per_euro = auths.election_difficulty;
            auths.foundation_account = auths.mint_distribution = auths.transaction_fee_distribution = auths.election_difficulty;
            auths.gas_rewards = auths.baker_stake_threshold = auths.add_anonymity_revoker = auths.add_identity_provider = auths.election_difficulty;
            test_same(enqueue_result::ok, upd.enqueue_update(sign_update_instruction(g.level1_signers({ 0 }), 1, 100, 0,
                update_payload_value { update_type::level2_keys, auths })));
            upd.process_due(100);
            expect(upd.keys.hash() != hash_before);
            test_same(payload_hash(upd.keys.keys()), upd.keys.hash());
            expect(upd.keys.keys().level2_keys == auths);
            test_same(enqueue_result::unauthorized, upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000)));
            test_same(enqueue_result::ok, upd.enqueue_update(difficulty_update({ { 0, new_l2.first } }, 1, 1000, 5'000)));
        };
        "protocol update is terminal"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            test_same(enqueue_result::ok, upd.enqueue_update(protocol_instruction(g, 1, 100, "P1")));
            test_same(enqueue_result::ok, upd.enqueue_update(protocol_instruction(g, 2, 200, "P2")));
            const auto pending = upd.protocol_status();
            test_same(2, std::get<pending_protocol_updates>(pending).updates.size());
            upd.process_due(150);
            const auto updated = upd.protocol_status();
            test_same(std::string { "P1" }, std::get<protocol_updated>(updated).update.message);
            upd.process_due(250);
            test_same(std::string { "P1" }, upd.current_protocol_update->message);
            expect(upd.pending.protocol_queue.empty());
        };
        "protocol updates due together"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            upd.enqueue_update(protocol_instruction(g, 1, 100, "P1"));
            upd.enqueue_update(protocol_instruction(g, 2, 200, "P2"));
            upd.process_due(300);
            test_same(std::string { "P1" }, upd.current_protocol_update->message);
        };
        "binary"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000));
            upd.enqueue_update(protocol_instruction(g, 1, 100, "P1"));
            const auto bytes = upd.to_bytes();
            const auto decoded = updates::from_bytes(bytes);
            expect(decoded == upd);
            test_same(upd.hash(), decoded.hash());
            upd.process_due(100);
            expect(static_cast<bool>(upd.current_protocol_update));
            const auto decoded_updated = updates::from_bytes(upd.to_bytes());
            expect(decoded_updated == upd);
            test_same(upd.hash(), decoded_updated.hash());
        };
        "binary invalid protocol update marker"_test = [&] {
            codec::encoder enc {};
            g.keys.to_bytes(enc);
            enc.u8(2);
            params.to_bytes(enc);
            expect(throws<codec::decode_error>([&] { updates::from_bytes(enc.data()); }));
        };
        "binary trailing bytes"_test = [&] {
            auto bytes = initial_updates(g.keys, params).to_bytes();
            bytes << uint8_t { 0 };
            expect(throws<codec::decode_error>([&] { updates::from_bytes(bytes); }));
        };
        "json"_test = [&] {
            auto upd = initial_updates(g.keys, params);
            upd.enqueue_update(difficulty_update(g.level2_signers({ 0 }), 1, 1000, 5'000));
            upd.enqueue_update(protocol_instruction(g, 1, 100, "P1"));
            upd.process_due(100);
            const auto j = json::parse(json::serialize(upd.to_json()));
            const auto decoded = updates::from_json(j);
            expect(decoded == upd);
            test_same(upd.hash(), decoded.hash());
            test_same(2, j.as_object().at("updateQueues").as_object().at("electionDifficulty").as_object().at("nextSequenceNumber").as_uint64());
        };
        "genesis json"_test = [&] {
            const json::object genesis {
                { "updateKeys", g.keys.to_json() },
                { "chainParameters", params.to_json() }
            };
            const auto upd = updates::from_genesis_json(genesis);
            expect(upd == initial_updates(g.keys, params));
            expect(throws([] { updates::from_genesis_json(json::object { { "updateKeys", json::object {} } }); }));
        };
        "hash"_test = [&] {
            const auto a = initial_updates(g.keys, params);
            const auto b = initial_updates(g.keys, params);
            test_same(a.hash(), b.hash());
            auto other_params = params;
            other_params.account_creation_limit += 1;
            expect(initial_updates(g.keys, other_params).hash() != a.hash());
            auto other_keys = g.keys;
            other_keys.level1_keys.threshold = 2;
            expect(initial_updates(other_keys, params).hash() != a.hash());
        };
    };
};
