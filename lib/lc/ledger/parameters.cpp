/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <lc/ledger/parameters.hpp>

namespace ledger_core::ledger {
    namespace {
        void check_fraction(const uint64_t v, const std::string_view what)
        {
            if (v > fraction_denominator) [[unlikely]]
                throw codec::decode_error(fmt::format("{} must not exceed {} but got {}", what, fraction_denominator, v));
        }

        void check_threshold(const uint16_t threshold, const size_t num_keys, const std::string_view what)
        {
            if (threshold == 0 || threshold > num_keys) [[unlikely]]
                throw codec::decode_error(fmt::format("{}: threshold {} must be within [1, {}]", what, threshold, num_keys));
        }

        key_list keys_from_bytes(codec::decoder &dec)
        {
            key_list keys {};
            const auto num_keys = dec.u16();
            keys.reserve(num_keys);
            for (size_t i = 0; i < num_keys; ++i)
                keys.emplace_back(dec.array<sizeof(ed25519::vkey)>());
            return keys;
        }

        void keys_to_bytes(codec::encoder &enc, const key_list &keys)
        {
            if (keys.size() > std::numeric_limits<uint16_t>::max()) [[unlikely]]
                throw error(fmt::format("a key list cannot have more than 65535 keys but got {}", keys.size()));
            enc.u16(static_cast<uint16_t>(keys.size()));
            for (const auto &k: keys)
                enc.bytes(k);
        }

        key_list keys_from_json(const json::array &arr)
        {
            key_list keys {};
            for (const auto &item: arr) {
                const auto &obj = json::as_object(item);
                if (const auto *scheme = obj.if_contains("schemeId"); scheme && json::as_str(*scheme) != "Ed25519") [[unlikely]]
                    throw error(fmt::format("unsupported signature scheme: {}", json::as_str(*scheme)));
                keys.emplace_back(json::to_bytes<sizeof(ed25519::vkey)>(json::field(obj, "verifyKey")));
            }
            return keys;
        }

        json::array keys_to_json(const key_list &keys)
        {
            json::array res {};
            for (const auto &k: keys) {
                res.emplace_back(json::object {
                    { "schemeId", "Ed25519" },
                    { "verifyKey", to_hex(k) }
                });
            }
            return res;
        }

        description description_from_bytes(codec::decoder &dec)
        {
            description d {};
            d.name = dec.text();
            d.url = dec.text();
            d.text = dec.text();
            return d;
        }

        void description_to_bytes(codec::encoder &enc, const description &d)
        {
            enc.text(d.name);
            enc.text(d.url);
            enc.text(d.text);
        }

        description description_from_json(const json::value &j)
        {
            const auto &obj = json::as_object(j);
            return {
                std::string { json::as_str(json::field(obj, "name")) },
                std::string { json::as_str(json::field(obj, "url")) },
                std::string { json::as_str(json::field(obj, "description")) }
            };
        }

        json::object description_to_json(const description &d)
        {
            return json::object {
                { "name", d.name },
                { "url", d.url },
                { "description", d.text }
            };
        }

        uint8_vector long_bytes(codec::decoder &dec)
        {
            const auto sz = dec.u64();
            if (sz > dec.remaining()) [[unlikely]]
                throw codec::decode_error(fmt::format("a byte string of {} bytes exceeds the remaining {} bytes", sz, dec.remaining()));
            return uint8_vector { dec.bytes(sz) };
        }

        void long_bytes(codec::encoder &enc, const buffer b)
        {
            enc.u64(b.size());
            enc.bytes(b);
        }
    }

    higher_level_keys higher_level_keys::from_bytes(codec::decoder &dec)
    {
        higher_level_keys res {};
        res.keys = keys_from_bytes(dec);
        res.threshold = dec.u16();
        check_threshold(res.threshold, res.keys.size(), "higher level keys");
        return res;
    }

    higher_level_keys higher_level_keys::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        higher_level_keys res {};
        res.keys = keys_from_json(json::field_array(obj, "keys"));
        res.threshold = json::field_uint<uint16_t>(obj, "threshold");
        check_threshold(res.threshold, res.keys.size(), "higher level keys");
        return res;
    }

    void higher_level_keys::to_bytes(codec::encoder &enc) const
    {
        keys_to_bytes(enc, keys);
        enc.u16(threshold);
    }

    json::object higher_level_keys::to_json() const
    {
        return json::object {
            { "keys", keys_to_json(keys) },
            { "threshold", threshold }
        };
    }

    access_structure access_structure::from_bytes(codec::decoder &dec)
    {
        access_structure res {};
        const auto num_keys = dec.u16();
        for (size_t i = 0; i < num_keys; ++i) {
            const auto idx = dec.u16();
            if (!res.keys.empty() && *res.keys.rbegin() >= idx) [[unlikely]]
                throw codec::decode_error(fmt::format("access structure key indices must be strictly ascending but got {} after {}", idx, *res.keys.rbegin()));
            res.keys.emplace_hint(res.keys.end(), idx);
        }
        res.threshold = dec.u16();
        check_threshold(res.threshold, res.keys.size(), "access structure");
        return res;
    }

    access_structure access_structure::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        access_structure res {};
        for (const auto &idx: json::field_array(obj, "authorizedKeys"))
            res.keys.emplace(json::to_uint<update_key_index>(idx));
        res.threshold = json::field_uint<uint16_t>(obj, "threshold");
        check_threshold(res.threshold, res.keys.size(), "access structure");
        return res;
    }

    void access_structure::to_bytes(codec::encoder &enc) const
    {
        enc.u16(static_cast<uint16_t>(keys.size()));
        for (const auto idx: keys)
            enc.u16(idx);
        enc.u16(threshold);
    }

    json::object access_structure::to_json() const
    {
        json::array idxs {};
        for (const auto idx: keys)
            idxs.emplace_back(idx);
        return json::object {
            { "authorizedKeys", std::move(idxs) },
            { "threshold", threshold }
        };
    }

    namespace {
        using access_field = std::pair<std::string_view, access_structure authorizations::*>;
        // the order defines the binary layout
        const std::array<access_field, 12> access_fields {
            access_field { "emergency", &authorizations::emergency },
            access_field { "protocol", &authorizations::protocol },
            access_field { "electionDifficulty", &authorizations::election_difficulty },
            access_field { "euroPerEnergy", &authorizations::euro_per_energy },
            access_field { "microGTUPerEuro", &authorizations::micro_gtu_per_euro },
            access_field { "foundationAccount", &authorizations::foundation_account },
            access_field { "mintDistribution", &authorizations::mint_distribution },
            access_field { "transactionFeeDistribution", &authorizations::transaction_fee_distribution },
            access_field { "gasRewards", &authorizations::gas_rewards },
            access_field { "bakerStakeThreshold", &authorizations::baker_stake_threshold },
            access_field { "addAnonymityRevoker", &authorizations::add_anonymity_revoker },
            access_field { "addIdentityProvider", &authorizations::add_identity_provider }
        };

        void check_access_bounds(const authorizations &auths)
        {
            for (const auto &[name, ptr]: access_fields) {
                const auto &as = auths.*ptr;
                if (!as.keys.empty() && *as.keys.rbegin() >= auths.keys.size()) [[unlikely]]
                    throw codec::decode_error(fmt::format("access structure {} refers to key {} but only {} level-2 keys are defined",
                        name, *as.keys.rbegin(), auths.keys.size()));
            }
        }
    }

    authorizations authorizations::from_bytes(codec::decoder &dec)
    {
        authorizations res {};
        res.keys = keys_from_bytes(dec);
        for (const auto &[name, ptr]: access_fields)
            res.*ptr = access_structure::from_bytes(dec);
        check_access_bounds(res);
        return res;
    }

    authorizations authorizations::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        authorizations res {};
        res.keys = keys_from_json(json::field_array(obj, "keys"));
        for (const auto &[name, ptr]: access_fields) {
            try {
                res.*ptr = access_structure::from_json(json::field(obj, name));
            } catch (const std::exception &ex) {
                throw error(fmt::format("invalid access structure {}", name), ex);
            }
        }
        check_access_bounds(res);
        return res;
    }

    void authorizations::to_bytes(codec::encoder &enc) const
    {
        keys_to_bytes(enc, keys);
        for (const auto &[name, ptr]: access_fields)
            (this->*ptr).to_bytes(enc);
    }

    json::object authorizations::to_json() const
    {
        json::object res {
            { "keys", keys_to_json(keys) }
        };
        for (const auto &[name, ptr]: access_fields)
            res.emplace(name, (this->*ptr).to_json());
        return res;
    }

    update_keys_collection update_keys_collection::from_bytes(codec::decoder &dec)
    {
        update_keys_collection res {};
        res.root_keys = higher_level_keys::from_bytes(dec);
        res.level1_keys = higher_level_keys::from_bytes(dec);
        res.level2_keys = authorizations::from_bytes(dec);
        return res;
    }

    update_keys_collection update_keys_collection::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        update_keys_collection res {};
        res.root_keys = higher_level_keys::from_json(json::field(obj, "rootKeys"));
        res.level1_keys = higher_level_keys::from_json(json::field(obj, "level1Keys"));
        res.level2_keys = authorizations::from_json(json::field(obj, "level2Keys"));
        return res;
    }

    void update_keys_collection::to_bytes(codec::encoder &enc) const
    {
        root_keys.to_bytes(enc);
        level1_keys.to_bytes(enc);
        level2_keys.to_bytes(enc);
    }

    json::object update_keys_collection::to_json() const
    {
        return json::object {
            { "rootKeys", root_keys.to_json() },
            { "level1Keys", level1_keys.to_json() },
            { "level2Keys", level2_keys.to_json() }
        };
    }

    protocol_update protocol_update::from_bytes(codec::decoder &dec)
    {
        protocol_update res {};
        res.message = dec.text();
        res.specification_url = dec.text();
        res.specification_hash = dec.array<sizeof(crypto::sha2::hash_256)>();
        res.specification_auxiliary_data = long_bytes(dec);
        return res;
    }

    protocol_update protocol_update::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        protocol_update res {};
        res.message = json::as_str(json::field(obj, "message"));
        res.specification_url = json::as_str(json::field(obj, "specificationURL"));
        res.specification_hash = json::to_bytes<sizeof(crypto::sha2::hash_256)>(json::field(obj, "specificationHash"));
        res.specification_auxiliary_data = uint8_vector::from_hex(json::as_str(json::field(obj, "specificationAuxiliaryData")));
        return res;
    }

    void protocol_update::to_bytes(codec::encoder &enc) const
    {
        enc.text(message);
        enc.text(specification_url);
        enc.bytes(specification_hash);
        long_bytes(enc, specification_auxiliary_data);
    }

    json::object protocol_update::to_json() const
    {
        return json::object {
            { "message", message },
            { "specificationURL", specification_url },
            { "specificationHash", to_hex(specification_hash) },
            { "specificationAuxiliaryData", to_hex(specification_auxiliary_data) }
        };
    }

    namespace {
        void check_difficulty(const uint32_t parts)
        {
            if (parts >= fraction_denominator) [[unlikely]]
                throw codec::decode_error(fmt::format("election difficulty must be below {} but got {}", fraction_denominator, parts));
        }
    }

    election_difficulty election_difficulty::from_bytes(codec::decoder &dec)
    {
        const election_difficulty res { dec.u32() };
        check_difficulty(res.parts);
        return res;
    }

    election_difficulty election_difficulty::from_json(const json::value &j)
    {
        const election_difficulty res { json::to_uint<uint32_t>(j) };
        check_difficulty(res.parts);
        return res;
    }

    void election_difficulty::to_bytes(codec::encoder &enc) const
    {
        enc.u32(parts);
    }

    json::value election_difficulty::to_json() const
    {
        return parts;
    }

    namespace {
        void check_rate(const exchange_rate &r)
        {
            if (r.numerator == 0 || r.denominator == 0) [[unlikely]]
                throw codec::decode_error(fmt::format("exchange rate {}/{} must have a non-zero numerator and denominator", r.numerator, r.denominator));
        }
    }

    exchange_rate exchange_rate::from_bytes(codec::decoder &dec)
    {
        exchange_rate res {};
        res.numerator = dec.u64();
        res.denominator = dec.u64();
        check_rate(res);
        return res;
    }

    exchange_rate exchange_rate::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        exchange_rate res {};
        res.numerator = json::field_uint<uint64_t>(obj, "numerator");
        res.denominator = json::field_uint<uint64_t>(obj, "denominator");
        check_rate(res);
        return res;
    }

    void exchange_rate::to_bytes(codec::encoder &enc) const
    {
        enc.u64(numerator);
        enc.u64(denominator);
    }

    json::object exchange_rate::to_json() const
    {
        return json::object {
            { "numerator", numerator },
            { "denominator", denominator }
        };
    }

    namespace {
        void check_mint(const mint_distribution &md)
        {
            check_fraction(static_cast<uint64_t>(md.baking_reward) + md.finalization_reward, "the sum of baking and finalization reward fractions");
        }
    }

    mint_distribution mint_distribution::from_bytes(codec::decoder &dec)
    {
        mint_distribution res {};
        res.mint_per_slot.mantissa = dec.u32();
        res.mint_per_slot.exponent = dec.u8();
        res.baking_reward = dec.u32();
        res.finalization_reward = dec.u32();
        check_mint(res);
        return res;
    }

    mint_distribution mint_distribution::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        const auto &rate = json::field_object(obj, "mintPerSlot");
        mint_distribution res {};
        res.mint_per_slot.mantissa = json::field_uint<uint32_t>(rate, "mantissa");
        res.mint_per_slot.exponent = json::field_uint<uint8_t>(rate, "exponent");
        res.baking_reward = json::field_uint<uint32_t>(obj, "bakingReward");
        res.finalization_reward = json::field_uint<uint32_t>(obj, "finalizationReward");
        check_mint(res);
        return res;
    }

    void mint_distribution::to_bytes(codec::encoder &enc) const
    {
        enc.u32(mint_per_slot.mantissa);
        enc.u8(mint_per_slot.exponent);
        enc.u32(baking_reward);
        enc.u32(finalization_reward);
    }

    json::object mint_distribution::to_json() const
    {
        return json::object {
            { "mintPerSlot", json::object {
                { "mantissa", mint_per_slot.mantissa },
                { "exponent", mint_per_slot.exponent }
            } },
            { "bakingReward", baking_reward },
            { "finalizationReward", finalization_reward }
        };
    }

    transaction_fee_distribution transaction_fee_distribution::from_bytes(codec::decoder &dec)
    {
        transaction_fee_distribution res {};
        res.baker = dec.u32();
        res.gas_account = dec.u32();
        check_fraction(static_cast<uint64_t>(res.baker) + res.gas_account, "the sum of baker and gas account fractions");
        return res;
    }

    transaction_fee_distribution transaction_fee_distribution::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        transaction_fee_distribution res {};
        res.baker = json::field_uint<uint32_t>(obj, "baker");
        res.gas_account = json::field_uint<uint32_t>(obj, "gasAccount");
        check_fraction(static_cast<uint64_t>(res.baker) + res.gas_account, "the sum of baker and gas account fractions");
        return res;
    }

    void transaction_fee_distribution::to_bytes(codec::encoder &enc) const
    {
        enc.u32(baker);
        enc.u32(gas_account);
    }

    json::object transaction_fee_distribution::to_json() const
    {
        return json::object {
            { "baker", baker },
            { "gasAccount", gas_account }
        };
    }

    namespace {
        void check_gas(const gas_rewards &g)
        {
            check_fraction(g.baker, "gas rewards baker fraction");
            check_fraction(g.finalization_proof, "gas rewards finalization proof fraction");
            check_fraction(g.account_creation, "gas rewards account creation fraction");
            check_fraction(g.chain_update, "gas rewards chain update fraction");
        }
    }

    gas_rewards gas_rewards::from_bytes(codec::decoder &dec)
    {
        gas_rewards res {};
        res.baker = dec.u32();
        res.finalization_proof = dec.u32();
        res.account_creation = dec.u32();
        res.chain_update = dec.u32();
        check_gas(res);
        return res;
    }

    gas_rewards gas_rewards::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        gas_rewards res {};
        res.baker = json::field_uint<uint32_t>(obj, "baker");
        res.finalization_proof = json::field_uint<uint32_t>(obj, "finalizationProof");
        res.account_creation = json::field_uint<uint32_t>(obj, "accountCreation");
        res.chain_update = json::field_uint<uint32_t>(obj, "chainUpdate");
        check_gas(res);
        return res;
    }

    void gas_rewards::to_bytes(codec::encoder &enc) const
    {
        enc.u32(baker);
        enc.u32(finalization_proof);
        enc.u32(account_creation);
        enc.u32(chain_update);
    }

    json::object gas_rewards::to_json() const
    {
        return json::object {
            { "baker", baker },
            { "finalizationProof", finalization_proof },
            { "accountCreation", account_creation },
            { "chainUpdate", chain_update }
        };
    }

    foundation_account foundation_account::from_bytes(codec::decoder &dec)
    {
        return { dec.u64() };
    }

    foundation_account foundation_account::from_json(const json::value &j)
    {
        return { json::to_uint<account_index>(j) };
    }

    void foundation_account::to_bytes(codec::encoder &enc) const
    {
        enc.u64(index);
    }

    json::value foundation_account::to_json() const
    {
        return index;
    }

    baker_stake_threshold baker_stake_threshold::from_bytes(codec::decoder &dec)
    {
        return { dec.u64() };
    }

    baker_stake_threshold baker_stake_threshold::from_json(const json::value &j)
    {
        return { json::to_uint<amount>(j) };
    }

    void baker_stake_threshold::to_bytes(codec::encoder &enc) const
    {
        enc.u64(min_stake);
    }

    json::value baker_stake_threshold::to_json() const
    {
        return min_stake;
    }

    ar_info ar_info::from_bytes(codec::decoder &dec)
    {
        ar_info res {};
        res.identity = dec.u32();
        res.desc = description_from_bytes(dec);
        res.public_key = long_bytes(dec);
        return res;
    }

    ar_info ar_info::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        ar_info res {};
        res.identity = json::field_uint<uint32_t>(obj, "arIdentity");
        res.desc = description_from_json(json::field(obj, "arDescription"));
        res.public_key = uint8_vector::from_hex(json::as_str(json::field(obj, "arPublicKey")));
        return res;
    }

    void ar_info::to_bytes(codec::encoder &enc) const
    {
        enc.u32(identity);
        description_to_bytes(enc, desc);
        long_bytes(enc, public_key);
    }

    json::object ar_info::to_json() const
    {
        return json::object {
            { "arIdentity", identity },
            { "arDescription", description_to_json(desc) },
            { "arPublicKey", to_hex(public_key) }
        };
    }

    ip_info ip_info::from_bytes(codec::decoder &dec)
    {
        ip_info res {};
        res.identity = dec.u32();
        res.desc = description_from_bytes(dec);
        res.verify_key = long_bytes(dec);
        res.cdi_verify_key = dec.array<sizeof(ed25519::vkey)>();
        return res;
    }

    ip_info ip_info::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        ip_info res {};
        res.identity = json::field_uint<uint32_t>(obj, "ipIdentity");
        res.desc = description_from_json(json::field(obj, "ipDescription"));
        res.verify_key = uint8_vector::from_hex(json::as_str(json::field(obj, "ipVerifyKey")));
        res.cdi_verify_key = json::to_bytes<sizeof(ed25519::vkey)>(json::field(obj, "ipCdiVerifyKey"));
        return res;
    }

    void ip_info::to_bytes(codec::encoder &enc) const
    {
        enc.u32(identity);
        description_to_bytes(enc, desc);
        long_bytes(enc, verify_key);
        enc.bytes(cdi_verify_key);
    }

    json::object ip_info::to_json() const
    {
        return json::object {
            { "ipIdentity", identity },
            { "ipDescription", description_to_json(desc) },
            { "ipVerifyKey", to_hex(verify_key) },
            { "ipCdiVerifyKey", to_hex(cdi_verify_key) }
        };
    }

    chain_parameters chain_parameters::from_bytes(codec::decoder &dec)
    {
        chain_parameters res {};
        res.difficulty = election_difficulty::from_bytes(dec);
        res.euro_per_energy = exchange_rate::from_bytes(dec);
        res.micro_gtu_per_euro = exchange_rate::from_bytes(dec);
        res.baker_cooldown_epochs = dec.u64();
        res.account_creation_limit = dec.u32();
        res.rewards.mint = mint_distribution::from_bytes(dec);
        res.rewards.fees = transaction_fee_distribution::from_bytes(dec);
        res.rewards.gas = gas_rewards::from_bytes(dec);
        res.foundation_account_index = dec.u64();
        res.min_baker_stake = dec.u64();
        return res;
    }

    chain_parameters chain_parameters::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        const auto &rewards = json::field_object(obj, "rewardParameters");
        chain_parameters res {};
        res.difficulty = election_difficulty::from_json(json::field(obj, "electionDifficulty"));
        res.euro_per_energy = exchange_rate::from_json(json::field(obj, "euroPerEnergy"));
        res.micro_gtu_per_euro = exchange_rate::from_json(json::field(obj, "microGTUPerEuro"));
        res.baker_cooldown_epochs = json::field_uint<uint64_t>(obj, "bakerCooldownEpochs");
        res.account_creation_limit = json::field_uint<uint32_t>(obj, "accountCreationLimit");
        res.rewards.mint = mint_distribution::from_json(json::field(rewards, "mintDistribution"));
        res.rewards.fees = transaction_fee_distribution::from_json(json::field(rewards, "transactionFeeDistribution"));
        res.rewards.gas = gas_rewards::from_json(json::field(rewards, "gasRewards"));
        res.foundation_account_index = json::field_uint<account_index>(obj, "foundationAccountIndex");
        res.min_baker_stake = json::field_uint<amount>(obj, "minimumThresholdForBaking");
        return res;
    }

    void chain_parameters::to_bytes(codec::encoder &enc) const
    {
        difficulty.to_bytes(enc);
        euro_per_energy.to_bytes(enc);
        micro_gtu_per_euro.to_bytes(enc);
        enc.u64(baker_cooldown_epochs);
        enc.u32(account_creation_limit);
        rewards.mint.to_bytes(enc);
        rewards.fees.to_bytes(enc);
        rewards.gas.to_bytes(enc);
        enc.u64(foundation_account_index);
        enc.u64(min_baker_stake);
    }

    json::object chain_parameters::to_json() const
    {
        return json::object {
            { "electionDifficulty", difficulty.to_json() },
            { "euroPerEnergy", euro_per_energy.to_json() },
            { "microGTUPerEuro", micro_gtu_per_euro.to_json() },
            { "bakerCooldownEpochs", baker_cooldown_epochs },
            { "accountCreationLimit", account_creation_limit },
            { "rewardParameters", json::object {
                { "mintDistribution", rewards.mint.to_json() },
                { "transactionFeeDistribution", rewards.fees.to_json() },
                { "gasRewards", rewards.gas.to_json() }
            } },
            { "foundationAccountIndex", foundation_account_index },
            { "minimumThresholdForBaking", min_baker_stake }
        };
    }
}
