/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_PARAMETERS_HPP
#define LEDGER_CORE_LEDGER_PARAMETERS_HPP

#include <lc/codec/binary.hpp>
#include <lc/ed25519.hpp>
#include <lc/json.hpp>
#include <lc/ledger/types.hpp>

namespace ledger_core::ledger {
    // reward fractions and the election difficulty are expressed in parts per 100000
    static constexpr uint32_t fraction_denominator = 100'000;

    using key_list = vector<ed25519::vkey>;

    // root and level-1 keys
    struct higher_level_keys {
        key_list keys {};
        uint16_t threshold = 1;

        static higher_level_keys from_bytes(codec::decoder &dec);
        static higher_level_keys from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const higher_level_keys &o) const =default;
    };

    // indices into the level-2 key list of an authorizations structure
    struct access_structure {
        flat_set<update_key_index> keys {};
        uint16_t threshold = 1;

        static access_structure from_bytes(codec::decoder &dec);
        static access_structure from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const access_structure &o) const =default;
    };

    struct authorizations {
        key_list keys {};
        access_structure emergency {};
        access_structure protocol {};
        access_structure election_difficulty {};
        access_structure euro_per_energy {};
        access_structure micro_gtu_per_euro {};
        access_structure foundation_account {};
        access_structure mint_distribution {};
        access_structure transaction_fee_distribution {};
        access_structure gas_rewards {};
        access_structure baker_stake_threshold {};
        access_structure add_anonymity_revoker {};
        access_structure add_identity_provider {};

        static authorizations from_bytes(codec::decoder &dec);
        static authorizations from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const authorizations &o) const =default;
    };

    struct update_keys_collection {
        higher_level_keys root_keys {};
        higher_level_keys level1_keys {};
        authorizations level2_keys {};

        static update_keys_collection from_bytes(codec::decoder &dec);
        static update_keys_collection from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const update_keys_collection &o) const =default;
    };

    struct protocol_update {
        std::string message {};
        std::string specification_url {};
        crypto::sha2::hash_256 specification_hash {};
        uint8_vector specification_auxiliary_data {};

        static protocol_update from_bytes(codec::decoder &dec);
        static protocol_update from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const protocol_update &o) const =default;
    };

    struct election_difficulty {
        uint32_t parts = 0;

        static election_difficulty from_bytes(codec::decoder &dec);
        static election_difficulty from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::value to_json() const;
        bool operator==(const election_difficulty &o) const =default;
    };

    struct exchange_rate {
        uint64_t numerator = 1;
        uint64_t denominator = 1;

        static exchange_rate from_bytes(codec::decoder &dec);
        static exchange_rate from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const exchange_rate &o) const =default;
    };

    // mantissa * 10^-exponent
    struct mint_rate {
        uint32_t mantissa = 0;
        uint8_t exponent = 0;

        bool operator==(const mint_rate &o) const =default;
    };

    struct mint_distribution {
        mint_rate mint_per_slot {};
        uint32_t baking_reward = 0;
        uint32_t finalization_reward = 0;

        static mint_distribution from_bytes(codec::decoder &dec);
        static mint_distribution from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const mint_distribution &o) const =default;
    };

    struct transaction_fee_distribution {
        uint32_t baker = 0;
        uint32_t gas_account = 0;

        static transaction_fee_distribution from_bytes(codec::decoder &dec);
        static transaction_fee_distribution from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const transaction_fee_distribution &o) const =default;
    };

    struct gas_rewards {
        uint32_t baker = 0;
        uint32_t finalization_proof = 0;
        uint32_t account_creation = 0;
        uint32_t chain_update = 0;

        static gas_rewards from_bytes(codec::decoder &dec);
        static gas_rewards from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const gas_rewards &o) const =default;
    };

    struct foundation_account {
        account_index index = 0;

        static foundation_account from_bytes(codec::decoder &dec);
        static foundation_account from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::value to_json() const;
        bool operator==(const foundation_account &o) const =default;
    };

    struct baker_stake_threshold {
        amount min_stake = 0;

        static baker_stake_threshold from_bytes(codec::decoder &dec);
        static baker_stake_threshold from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::value to_json() const;
        bool operator==(const baker_stake_threshold &o) const =default;
    };

    struct description {
        std::string name {};
        std::string url {};
        std::string text {};

        bool operator==(const description &o) const =default;
    };

    // anonymity revoker
    struct ar_info {
        uint32_t identity = 0;
        description desc {};
        uint8_vector public_key {};

        static ar_info from_bytes(codec::decoder &dec);
        static ar_info from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const ar_info &o) const =default;
    };

    // identity provider
    struct ip_info {
        uint32_t identity = 0;
        description desc {};
        uint8_vector verify_key {};
        ed25519::vkey cdi_verify_key {};

        static ip_info from_bytes(codec::decoder &dec);
        static ip_info from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const ip_info &o) const =default;
    };

    struct reward_parameters {
        mint_distribution mint {};
        transaction_fee_distribution fees {};
        gas_rewards gas {};

        bool operator==(const reward_parameters &o) const =default;
    };

    struct chain_parameters {
        election_difficulty difficulty {};
        exchange_rate euro_per_energy {};
        exchange_rate micro_gtu_per_euro {};
        uint64_t baker_cooldown_epochs = 0;
        uint32_t account_creation_limit = 0;
        reward_parameters rewards {};
        account_index foundation_account_index = 0;
        amount min_baker_stake = 0;

        static chain_parameters from_bytes(codec::decoder &dec);
        static chain_parameters from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const chain_parameters &o) const =default;
    };
}

#endif // !LEDGER_CORE_LEDGER_PARAMETERS_HPP
