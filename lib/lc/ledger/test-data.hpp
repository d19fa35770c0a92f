/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_TEST_DATA_HPP
#define LEDGER_CORE_LEDGER_TEST_DATA_HPP

#include <lc/ledger/state.hpp>

// deterministic keys, transactions and governance setups shared by the ledger test suites
namespace ledger_core::ledger::test_data {
    inline std::pair<ed25519::skey, ed25519::vkey> key_pair(const std::string_view name)
    {
        return ed25519::create_from_seed(crypto::sha2::digest(buffer { name }));
    }

    inline account_address address(const uint8_t id)
    {
        const std::string name = fmt::format("account-{}", id);
        return crypto::sha2::digest(buffer { name });
    }

    inline std::pair<ed25519::skey, ed25519::vkey> account_key(const uint8_t id)
    {
        return key_pair(fmt::format("account-key-{}", id));
    }

    inline account_keys account_keys_of(const uint8_t id)
    {
        account_keys keys {};
        keys.keys.emplace(0, account_key(id).second);
        return keys;
    }

    inline block_hash block(const std::string_view name)
    {
        return crypto::sha2::digest(buffer { name });
    }

    inline transaction_ptr make_tx(const uint8_t sender_id, const account_nonce nonce, const transaction_time expiry=1000,
        const std::string_view payload="transfer", const transaction_time arrival=100)
    {
        transaction_header hdr {};
        hdr.sender = address(sender_id);
        hdr.nonce = nonce;
        hdr.energy = 500;
        hdr.expiry = expiry;
        const signing_key_list keys { { 0, account_key(sender_id).first } };
        return std::make_shared<const transaction>(sign_transaction(keys, hdr, buffer { payload }, arrival));
    }

    inline chain_parameters sample_params()
    {
        chain_parameters params {};
        params.difficulty = { 2'500 };
        params.euro_per_energy = { 1, 50'000 };
        params.micro_gtu_per_euro = { 100'000, 1 };
        params.baker_cooldown_epochs = 166;
        params.account_creation_limit = 10;
        params.rewards.mint = { { 7'555, 16 }, 60'000, 30'000 };
        params.rewards.fees = { 45'000, 45'000 };
        params.rewards.gas = { 25'000, 50, 2'000, 5 };
        params.foundation_account_index = 0;
        params.min_baker_stake = 15'000'000'000;
        return params;
    }

    struct governance {
        vector<ed25519::skey> root {};
        vector<ed25519::skey> level1 {};
        vector<ed25519::skey> level2 {};
        update_keys_collection keys {};

        update_signing_key_list root_signers(const std::initializer_list<update_key_index> idxs) const
        {
            return _signers(root, idxs);
        }

        update_signing_key_list level1_signers(const std::initializer_list<update_key_index> idxs) const
        {
            return _signers(level1, idxs);
        }

        update_signing_key_list level2_signers(const std::initializer_list<update_key_index> idxs) const
        {
            return _signers(level2, idxs);
        }
    private:
        static update_signing_key_list _signers(const vector<ed25519::skey> &sks, const std::initializer_list<update_key_index> idxs)
        {
            update_signing_key_list res {};
            for (const auto idx: idxs)
                res.emplace_back(idx, sks.at(idx));
            return res;
        }
    };

    // root: 2 keys with threshold 2, level 1: 2 keys with threshold 1,
    // level 2: 3 keys, protocol updates need keys 0 and 2, everything else any one of keys 0 and 1
    inline governance sample_governance()
    {
        governance g {};
        for (size_t i = 0; i < 2; ++i) {
            auto [sk, vk] = key_pair(fmt::format("root-{}", i));
            g.root.emplace_back(sk);
            g.keys.root_keys.keys.emplace_back(vk);
        }
        g.keys.root_keys.threshold = 2;
        for (size_t i = 0; i < 2; ++i) {
            auto [sk, vk] = key_pair(fmt::format("level1-{}", i));
            g.level1.emplace_back(sk);
            g.keys.level1_keys.keys.emplace_back(vk);
        }
        g.keys.level1_keys.threshold = 1;
        auto &l2 = g.keys.level2_keys;
        for (size_t i = 0; i < 3; ++i) {
            auto [sk, vk] = key_pair(fmt::format("level2-{}", i));
            g.level2.emplace_back(sk);
            l2.keys.emplace_back(vk);
        }
        const access_structure any_of_two { { 0, 1 }, 1 };
        l2.emergency = any_of_two;
        l2.protocol = access_structure { { 0, 2 }, 2 };
        l2.election_difficulty = any_of_two;
        l2.euro_per_energy = any_of_two;
        l2.micro_gtu_per_euro = any_of_two;
        l2.foundation_account = any_of_two;
        l2.mint_distribution = any_of_two;
        l2.transaction_fee_distribution = any_of_two;
        l2.gas_rewards = any_of_two;
        l2.baker_stake_threshold = any_of_two;
        l2.add_anonymity_revoker = any_of_two;
        l2.add_identity_provider = any_of_two;
        return g;
    }

    inline protocol_update sample_protocol_update(const std::string_view message="P2")
    {
        protocol_update pu {};
        pu.message = message;
        pu.specification_url = "https://example.com/p2.md";
        pu.specification_hash = crypto::sha2::digest(buffer { message });
        pu.specification_auxiliary_data = uint8_vector::from_hex("0102");
        return pu;
    }
}

#endif // !LEDGER_CORE_LEDGER_TEST_DATA_HPP
