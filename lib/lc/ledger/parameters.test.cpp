/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <typeinfo>
#include <lc/ledger/test-data.hpp>
#include <lc/common/test.hpp>

using namespace ledger_core;
using namespace ledger_core::ledger;

namespace {
    template<typename T>
    T decode(const buffer bytes)
    {
        codec::decoder dec { bytes };
        auto res = T::from_bytes(dec);
        dec.expect_end(typeid(T).name());
        return res;
    }

    template<typename T>
    void expect_binary_and_json(const T &v)
    {
        expect(decode<T>(payload_bytes(v)) == v);
        const auto j = json::value(v.to_json());
        expect(T::from_json(json::parse(json::serialize(j))) == v);
    }
}

suite ledger_parameters_suite = [] {
    "ledger::parameters"_test = [] {
        "chain parameters"_test = [] {
            const auto params = test_data::sample_params();
            expect_binary_and_json(params);
            const auto j = params.to_json();
            test_same(2500, j.at("electionDifficulty").as_uint64());
            test_same(60000, j.at("rewardParameters").as_object().at("mintDistribution").as_object().at("bakingReward").as_uint64());
            test_same(15'000'000'000ULL, j.at("minimumThresholdForBaking").as_uint64());
        };
        "update keys"_test = [] {
            const auto g = test_data::sample_governance();
            expect_binary_and_json(g.keys);
            const auto j = g.keys.to_json();
            test_same(std::string_view { "Ed25519" },
                json::as_str(j.at("rootKeys").as_object().at("keys").as_array().at(0).as_object().at("schemeId")));
            test_same(2, j.at("level2Keys").as_object().at("protocol").as_object().at("authorizedKeys").as_array().size());
        };
        "protocol update"_test = [] {
            const auto pu = test_data::sample_protocol_update();
            expect_binary_and_json(pu);
            test_same(std::string { "0102" }, std::string { json::as_str(pu.to_json().at("specificationAuxiliaryData")) });
        };
        "anonymity revokers and identity providers"_test = [] {
            const ar_info ar { 7, { "AR-7", "https://ar.example.com", "revoker" }, uint8_vector::from_hex("A1B2C3") };
            expect_binary_and_json(ar);
            const ip_info ip { 3, { "IP-3", "https://ip.example.com", "provider" }, uint8_vector::from_hex("D4E5"), test_data::key_pair("ip-3").second };
            expect_binary_and_json(ip);
        };
        "thresholds"_test = [] {
            codec::encoder enc {};
            higher_level_keys keys {};
            keys.keys.emplace_back(test_data::key_pair("k").second);
            keys.threshold = 2;
            keys.to_bytes(enc);
            expect(throws<codec::decode_error>([&] { decode<higher_level_keys>(enc.data()); }));
            keys.threshold = 0;
            expect(throws<codec::decode_error>([&] { decode<higher_level_keys>(payload_bytes(keys)); }));
            keys.threshold = 1;
            expect(nothrow([&] { decode<higher_level_keys>(payload_bytes(keys)); }));
        };
        "access structures"_test = [] {
            codec::encoder unordered {};
            unordered.u16(2).u16(3).u16(1).u16(1);
            expect(throws<codec::decode_error>([&] { decode<access_structure>(unordered.data()); }));
            codec::encoder repeated {};
            repeated.u16(2).u16(1).u16(1).u16(1);
            expect(throws<codec::decode_error>([&] { decode<access_structure>(repeated.data()); }));
            auto auths = test_data::sample_governance().keys.level2_keys;
            auths.gas_rewards = access_structure { { 0, 5 }, 1 };
            expect(throws<codec::decode_error>([&] { decode<authorizations>(payload_bytes(auths)); }));
            expect(throws([&] { authorizations::from_json(auths.to_json()); }));
        };
        "fractions"_test = [] {
            expect(throws<codec::decode_error>([] { decode<election_difficulty>(payload_bytes(election_difficulty { 100'000 })); }));
            expect(nothrow([] { decode<election_difficulty>(payload_bytes(election_difficulty { 99'999 })); }));
            expect(throws<codec::decode_error>([] { decode<mint_distribution>(payload_bytes(mint_distribution { { 1, 1 }, 60'000, 40'001 })); }));
            expect(nothrow([] { decode<mint_distribution>(payload_bytes(mint_distribution { { 1, 1 }, 60'000, 40'000 })); }));
            expect(throws<codec::decode_error>([] { decode<transaction_fee_distribution>(payload_bytes(transaction_fee_distribution { 50'001, 50'000 })); }));
            expect(throws<codec::decode_error>([] { decode<gas_rewards>(payload_bytes(gas_rewards { 1, 2, 100'001, 4 })); }));
            expect(throws([] { election_difficulty::from_json(json::value(100'000)); }));
        };
        "exchange rates"_test = [] {
            expect(throws<codec::decode_error>([] { decode<exchange_rate>(payload_bytes(exchange_rate { 0, 1 })); }));
            expect(throws<codec::decode_error>([] { decode<exchange_rate>(payload_bytes(exchange_rate { 1, 0 })); }));
            expect(throws([] { exchange_rate::from_json(json::parse(R"({ "numerator": 1, "denominator": 0 })")); }));
        };
        "truncated"_test = [] {
            const auto bytes = payload_bytes(test_data::sample_params());
            expect(throws<codec::decode_error>([&] { decode<chain_parameters>(buffer { bytes }.subbuf(0, bytes.size() - 1)); }));
            const auto pu_bytes = payload_bytes(test_data::sample_protocol_update());
            expect(throws<codec::decode_error>([&] { decode<protocol_update>(buffer { pu_bytes }.subbuf(0, pu_bytes.size() - 1)); }));
        };
    };
};
