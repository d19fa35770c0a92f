/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_UPDATE_INSTRUCTION_HPP
#define LEDGER_CORE_LEDGER_UPDATE_INSTRUCTION_HPP

#include <variant>
#include <lc/ledger/parameters.hpp>

namespace ledger_core::ledger {
    enum class update_type: uint8_t {
        protocol = 1,
        election_difficulty = 2,
        euro_per_energy = 3,
        micro_gtu_per_euro = 4,
        foundation_account = 5,
        mint_distribution = 6,
        transaction_fee_distribution = 7,
        gas_rewards = 8,
        baker_stake_threshold = 9,
        root_keys = 10,
        level1_keys = 11,
        add_anonymity_revoker = 12,
        add_identity_provider = 13,
        level2_keys = 14
    };

    struct update_payload_value {
        using value_type = std::variant<higher_level_keys, authorizations, protocol_update, election_difficulty,
            exchange_rate, foundation_account, mint_distribution, transaction_fee_distribution, gas_rewards,
            baker_stake_threshold, ar_info, ip_info>;

        update_type type;
        value_type value;

        // throws when the value's alternative does not correspond to the type
        update_payload_value(update_type type, value_type value);

        static update_payload_value from_bytes(codec::decoder &dec);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const update_payload_value &o) const =default;
    };

    struct update_header {
        static constexpr size_t serialized_size = 3 * sizeof(uint64_t) + sizeof(payload_length);

        update_sequence_number seq = min_update_sequence_number;
        transaction_time effective_time = 0;
        transaction_time timeout = 0;
        payload_length payload_size = 0;

        static update_header from_bytes(codec::decoder &dec);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const update_header &o) const =default;
    };

    struct update_signature_entry {
        update_key_index index = 0;
        uint8_vector sig {};

        bool operator==(const update_signature_entry &o) const =default;
    };
    using update_signature_list = vector<update_signature_entry>;

    // wire form: header, payload, [count:u16] then count * [key index:u16][length:u16][signature bytes]
    struct update_instruction {
        static update_instruction from_bytes(codec::decoder &dec);
        static update_instruction from_bytes(buffer bytes);

        update_instruction(const update_header &hdr, update_payload_value payload, update_signature_list sigs);

        const update_header &header() const noexcept
        {
            return _header;
        }

        const update_payload_value &payload() const noexcept
        {
            return _payload;
        }

        const update_signature_list &signatures() const noexcept
        {
            return _signatures;
        }

        // the signed message: SHA-256 of the header and payload bytes
        const crypto::sha2::hash_256 &hash() const noexcept
        {
            return _hash;
        }

        void to_bytes(codec::encoder &enc) const;
        uint8_vector to_bytes() const;
        json::object to_json() const;
    private:
        update_header _header;
        update_payload_value _payload;
        update_signature_list _signatures;
        crypto::sha2::hash_256 _hash;
    };

    using update_signing_key_list = vector<std::pair<update_key_index, ed25519::skey>>;

    extern update_instruction sign_update_instruction(const update_signing_key_list &keys, update_sequence_number seq,
        transaction_time effective_time, transaction_time timeout, update_payload_value payload);
}

namespace fmt {
    template<>
    struct formatter<ledger_core::ledger::update_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace ledger_core::ledger;
            switch (v) {
                case update_type::protocol: return fmt::format_to(ctx.out(), "protocol");
                case update_type::election_difficulty: return fmt::format_to(ctx.out(), "electionDifficulty");
                case update_type::euro_per_energy: return fmt::format_to(ctx.out(), "euroPerEnergy");
                case update_type::micro_gtu_per_euro: return fmt::format_to(ctx.out(), "microGTUPerEuro");
                case update_type::foundation_account: return fmt::format_to(ctx.out(), "foundationAccount");
                case update_type::mint_distribution: return fmt::format_to(ctx.out(), "mintDistribution");
                case update_type::transaction_fee_distribution: return fmt::format_to(ctx.out(), "transactionFeeDistribution");
                case update_type::gas_rewards: return fmt::format_to(ctx.out(), "gasRewards");
                case update_type::baker_stake_threshold: return fmt::format_to(ctx.out(), "bakerStakeThreshold");
                case update_type::root_keys: return fmt::format_to(ctx.out(), "rootKeys");
                case update_type::level1_keys: return fmt::format_to(ctx.out(), "level1Keys");
                case update_type::add_anonymity_revoker: return fmt::format_to(ctx.out(), "addAnonymityRevoker");
                case update_type::add_identity_provider: return fmt::format_to(ctx.out(), "addIdentityProvider");
                case update_type::level2_keys: return fmt::format_to(ctx.out(), "level2Keys");
                default: throw ledger_core::error(fmt::format("unsupported update_type value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !LEDGER_CORE_LEDGER_UPDATE_INSTRUCTION_HPP
