/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_UPDATES_HPP
#define LEDGER_CORE_LEDGER_UPDATES_HPP

#include <optional>
#include <variant>
#include <lc/ledger/parameters.hpp>
#include <lc/ledger/update-instruction.hpp>
#include <lc/ledger/update-queue.hpp>

namespace ledger_core::ledger {
    struct pending_updates {
        update_queue<higher_level_keys> root_keys_queue {};
        update_queue<higher_level_keys> level1_keys_queue {};
        update_queue<authorizations> level2_keys_queue {};
        update_queue<protocol_update> protocol_queue {};
        update_queue<election_difficulty> election_difficulty_queue {};
        update_queue<exchange_rate> euro_per_energy_queue {};
        update_queue<exchange_rate> micro_gtu_per_euro_queue {};
        update_queue<foundation_account> foundation_account_queue {};
        update_queue<mint_distribution> mint_distribution_queue {};
        update_queue<transaction_fee_distribution> transaction_fee_distribution_queue {};
        update_queue<gas_rewards> gas_rewards_queue {};
        update_queue<baker_stake_threshold> baker_stake_threshold_queue {};
        update_queue<ar_info> add_anonymity_revoker_queue {};
        update_queue<ip_info> add_identity_provider_queue {};

        // visits the queues in the order that defines the binary layout and the hash
        template<typename F>
        void foreach_queue(const F &observer) const
        {
            _foreach_queue(*this, observer);
        }

        template<typename F>
        void foreach_queue(const F &observer)
        {
            _foreach_queue(*this, observer);
        }

        static pending_updates from_bytes(codec::decoder &dec);
        static pending_updates from_json(const json::value &j);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        crypto::sha2::hash_256 hash() const;
        bool operator==(const pending_updates &o) const =default;
    private:
        template<typename T, typename F>
        static void _foreach_queue(T &pu, const F &observer)
        {
            observer("rootKeys", pu.root_keys_queue);
            observer("level1Keys", pu.level1_keys_queue);
            observer("level2Keys", pu.level2_keys_queue);
            observer("protocol", pu.protocol_queue);
            observer("electionDifficulty", pu.election_difficulty_queue);
            observer("euroPerEnergy", pu.euro_per_energy_queue);
            observer("microGTUPerEuro", pu.micro_gtu_per_euro_queue);
            observer("foundationAccount", pu.foundation_account_queue);
            observer("mintDistribution", pu.mint_distribution_queue);
            observer("transactionFeeDistribution", pu.transaction_fee_distribution_queue);
            observer("gasRewards", pu.gas_rewards_queue);
            observer("bakerStakeThreshold", pu.baker_stake_threshold_queue);
            observer("addAnonymityRevoker", pu.add_anonymity_revoker_queue);
            observer("addIdentityProvider", pu.add_identity_provider_queue);
        }
    };

    struct protocol_updated {
        protocol_update update;
    };

    struct pending_protocol_updates {
        update_queue<protocol_update>::entry_list updates {};
    };

    using protocol_update_status = std::variant<protocol_updated, pending_protocol_updates>;

    // key collection together with its hash which is computed once per change
    struct hashed_keys {
        explicit hashed_keys(update_keys_collection keys);

        const update_keys_collection &keys() const noexcept
        {
            return _keys;
        }

        const crypto::sha2::hash_256 &hash() const noexcept
        {
            return _hash;
        }

        bool operator==(const hashed_keys &o) const
        {
            return _hash == o._hash && _keys == o._keys;
        }
    private:
        update_keys_collection _keys;
        crypto::sha2::hash_256 _hash;
    };

    // updates that take effect outside of the chain parameters
    struct processed_updates {
        vector<ar_info> anonymity_revokers {};
        vector<ip_info> identity_providers {};
    };

    enum class enqueue_result {
        ok, sequence_number_mismatch, unauthorized, expired_timeout
    };

    struct updates {
        hashed_keys keys;
        // once set, the chain has reached its terminal state and no further protocol updates take effect
        std::optional<protocol_update> current_protocol_update {};
        chain_parameters params;
        pending_updates pending {};

        static updates from_bytes(codec::decoder &dec);
        static updates from_bytes(buffer bytes);
        static updates from_json(const json::value &j);
        // {"updateKeys": ..., "chainParameters": ...}
        static updates from_genesis_json(const json::value &j);

        void to_bytes(codec::encoder &enc) const;
        uint8_vector to_bytes() const;
        json::object to_json() const;
        crypto::sha2::hash_256 hash() const;
        protocol_update_status protocol_status() const;
        processed_updates process_due(transaction_time ts);
        bool authorized(const update_instruction &instr) const;
        enqueue_result enqueue_update(const update_instruction &instr);
        update_sequence_number next_sequence_number(update_type type) const;
        bool operator==(const updates &o) const =default;
    };

    extern updates initial_updates(const update_keys_collection &keys, const chain_parameters &params);
}

namespace fmt {
    template<>
    struct formatter<ledger_core::ledger::enqueue_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace ledger_core::ledger;
            switch (v) {
                case enqueue_result::ok: return fmt::format_to(ctx.out(), "ok");
                case enqueue_result::sequence_number_mismatch: return fmt::format_to(ctx.out(), "sequence_number_mismatch");
                case enqueue_result::unauthorized: return fmt::format_to(ctx.out(), "unauthorized");
                case enqueue_result::expired_timeout: return fmt::format_to(ctx.out(), "expired_timeout");
                default: throw ledger_core::error(fmt::format("unsupported enqueue_result value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !LEDGER_CORE_LEDGER_UPDATES_HPP
