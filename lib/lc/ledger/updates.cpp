/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/updates.hpp>

namespace ledger_core::ledger {
    namespace {
        // the queue that instructions of the given type are enqueued into
        template<typename T, typename F>
        decltype(auto) visit_queue(T &pu, const update_type type, const F &observer)
        {
            switch (type) {
                case update_type::root_keys: return observer(pu.root_keys_queue);
                case update_type::level1_keys: return observer(pu.level1_keys_queue);
                case update_type::level2_keys: return observer(pu.level2_keys_queue);
                case update_type::protocol: return observer(pu.protocol_queue);
                case update_type::election_difficulty: return observer(pu.election_difficulty_queue);
                case update_type::euro_per_energy: return observer(pu.euro_per_energy_queue);
                case update_type::micro_gtu_per_euro: return observer(pu.micro_gtu_per_euro_queue);
                case update_type::foundation_account: return observer(pu.foundation_account_queue);
                case update_type::mint_distribution: return observer(pu.mint_distribution_queue);
                case update_type::transaction_fee_distribution: return observer(pu.transaction_fee_distribution_queue);
                case update_type::gas_rewards: return observer(pu.gas_rewards_queue);
                case update_type::baker_stake_threshold: return observer(pu.baker_stake_threshold_queue);
                case update_type::add_anonymity_revoker: return observer(pu.add_anonymity_revoker_queue);
                case update_type::add_identity_provider: return observer(pu.add_identity_provider_queue);
                default: throw error(fmt::format("unsupported update type: {}", static_cast<int>(type)));
            }
        }

        template<typename E, typename F>
        void apply_due(update_queue<E> &q, const transaction_time ts, const F &apply)
        {
            for (auto &e: q.dequeue_due(ts))
                apply(e);
        }

        bool signatures_valid(const update_instruction &instr, const key_list &keys,
            const flat_set<update_key_index> *allowed, const uint16_t threshold)
        {
            const auto &sigs = instr.signatures();
            if (sigs.size() < threshold)
                return false;
            set<update_key_index> seen {};
            for (const auto &[idx, sig]: sigs) {
                if (!seen.emplace(idx).second)
                    return false;
                if (allowed && allowed->count(idx) == 0)
                    return false;
                if (idx >= keys.size())
                    return false;
                if (sig.size() != sizeof(ed25519::signature))
                    return false;
                if (!ed25519::verify(sig, keys[idx], instr.hash()))
                    return false;
            }
            return true;
        }
    }

    pending_updates pending_updates::from_bytes(codec::decoder &dec)
    {
        pending_updates res {};
        res.foreach_queue([&](const std::string_view, auto &q) {
            q = std::decay_t<decltype(q)>::from_bytes(dec);
        });
        return res;
    }

    pending_updates pending_updates::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        pending_updates res {};
        res.foreach_queue([&](const std::string_view name, auto &q) {
            try {
                q = std::decay_t<decltype(q)>::from_json(json::field(obj, name));
            } catch (const std::exception &ex) {
                throw error(fmt::format("invalid update queue {}", name), ex);
            }
        });
        return res;
    }

    void pending_updates::to_bytes(codec::encoder &enc) const
    {
        foreach_queue([&](const std::string_view, const auto &q) {
            q.to_bytes(enc);
        });
    }

    json::object pending_updates::to_json() const
    {
        json::object res {};
        foreach_queue([&](const std::string_view name, const auto &q) {
            res.emplace(name, q.to_json());
        });
        return res;
    }

    crypto::sha2::hash_256 pending_updates::hash() const
    {
        codec::encoder enc {};
        foreach_queue([&](const std::string_view, const auto &q) {
            enc.bytes(q.hash());
        });
        return crypto::sha2::digest(enc.data());
    }

    hashed_keys::hashed_keys(update_keys_collection keys):
        _keys { std::move(keys) }, _hash { payload_hash(_keys) }
    {
    }

    updates initial_updates(const update_keys_collection &keys, const chain_parameters &params)
    {
        return updates { hashed_keys { keys }, {}, params, {} };
    }

    updates updates::from_bytes(codec::decoder &dec)
    {
        auto keys = update_keys_collection::from_bytes(dec);
        std::optional<protocol_update> pu {};
        switch (const auto marker = dec.u8(); marker) {
            case 0:
                break;
            case 1:
                pu = protocol_update::from_bytes(dec);
                break;
            default:
                throw codec::decode_error(fmt::format("Invalid Updates: unexpected protocol update marker {}", marker));
        }
        auto params = chain_parameters::from_bytes(dec);
        auto pending = pending_updates::from_bytes(dec);
        return updates { hashed_keys { std::move(keys) }, std::move(pu), std::move(params), std::move(pending) };
    }

    updates updates::from_bytes(const buffer bytes)
    {
        codec::decoder dec { bytes };
        auto res = from_bytes(dec);
        dec.expect_end("updates");
        return res;
    }

    updates updates::from_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        std::optional<protocol_update> pu {};
        if (const auto *pu_j = obj.if_contains("protocolUpdate"); pu_j && !pu_j->is_null())
            pu = protocol_update::from_json(*pu_j);
        return updates {
            hashed_keys { update_keys_collection::from_json(json::field(obj, "keys")) },
            std::move(pu),
            chain_parameters::from_json(json::field(obj, "chainParameters")),
            pending_updates::from_json(json::field(obj, "updateQueues"))
        };
    }

    updates updates::from_genesis_json(const json::value &j)
    {
        const auto &obj = json::as_object(j);
        return initial_updates(update_keys_collection::from_json(json::field(obj, "updateKeys")),
            chain_parameters::from_json(json::field(obj, "chainParameters")));
    }

    void updates::to_bytes(codec::encoder &enc) const
    {
        keys.keys().to_bytes(enc);
        if (current_protocol_update) {
            enc.u8(1);
            current_protocol_update->to_bytes(enc);
        } else {
            enc.u8(0);
        }
        params.to_bytes(enc);
        pending.to_bytes(enc);
    }

    uint8_vector updates::to_bytes() const
    {
        codec::encoder enc {};
        to_bytes(enc);
        return enc.take();
    }

    json::object updates::to_json() const
    {
        json::object res {
            { "keys", keys.keys().to_json() },
            { "chainParameters", params.to_json() },
            { "updateQueues", pending.to_json() }
        };
        if (current_protocol_update)
            res.emplace("protocolUpdate", current_protocol_update->to_json());
        return res;
    }

    crypto::sha2::hash_256 updates::hash() const
    {
        codec::encoder enc {};
        enc.bytes(keys.hash());
        if (current_protocol_update) {
            enc.u8(1);
            enc.bytes(payload_hash(*current_protocol_update));
        } else {
            enc.u8(0);
        }
        enc.bytes(payload_hash(params));
        enc.bytes(pending.hash());
        return crypto::sha2::digest(enc.data());
    }

    protocol_update_status updates::protocol_status() const
    {
        if (current_protocol_update)
            return protocol_updated { *current_protocol_update };
        return pending_protocol_updates { pending.protocol_queue.entries };
    }

    processed_updates updates::process_due(const transaction_time ts)
    {
        processed_updates res {};
        auto new_keys = keys.keys();
        bool keys_changed = false;
        apply_due(pending.root_keys_queue, ts, [&](auto &e) {
            new_keys.root_keys = std::move(e.update);
            keys_changed = true;
        });
        apply_due(pending.level1_keys_queue, ts, [&](auto &e) {
            new_keys.level1_keys = std::move(e.update);
            keys_changed = true;
        });
        apply_due(pending.level2_keys_queue, ts, [&](auto &e) {
            new_keys.level2_keys = std::move(e.update);
            keys_changed = true;
        });
        if (keys_changed) {
            keys = hashed_keys { std::move(new_keys) };
            logger::info("updates: the key collection changed at {}, new hash: {}", ts, keys.hash());
        }
        apply_due(pending.protocol_queue, ts, [&](auto &e) {
            if (current_protocol_update) {
                logger::warn("updates: ignoring the protocol update effective at {} since a protocol update is already in effect", e.effective_time);
                return;
            }
            logger::info("updates: protocol update effective at {}: {}", e.effective_time, e.update.message);
            current_protocol_update = std::move(e.update);
        });
        apply_due(pending.election_difficulty_queue, ts, [&](auto &e) {
            params.difficulty = e.update;
        });
        apply_due(pending.euro_per_energy_queue, ts, [&](auto &e) {
            params.euro_per_energy = e.update;
        });
        apply_due(pending.micro_gtu_per_euro_queue, ts, [&](auto &e) {
            params.micro_gtu_per_euro = e.update;
        });
        apply_due(pending.foundation_account_queue, ts, [&](auto &e) {
            params.foundation_account_index = e.update.index;
        });
        apply_due(pending.mint_distribution_queue, ts, [&](auto &e) {
            params.rewards.mint = e.update;
        });
        apply_due(pending.transaction_fee_distribution_queue, ts, [&](auto &e) {
            params.rewards.fees = e.update;
        });
        apply_due(pending.gas_rewards_queue, ts, [&](auto &e) {
            params.rewards.gas = e.update;
        });
        apply_due(pending.baker_stake_threshold_queue, ts, [&](auto &e) {
            params.min_baker_stake = e.update.min_stake;
        });
        apply_due(pending.add_anonymity_revoker_queue, ts, [&](auto &e) {
            res.anonymity_revokers.emplace_back(std::move(e.update));
        });
        apply_due(pending.add_identity_provider_queue, ts, [&](auto &e) {
            res.identity_providers.emplace_back(std::move(e.update));
        });
        return res;
    }

    bool updates::authorized(const update_instruction &instr) const
    {
        const auto &k = keys.keys();
        const auto &l2 = k.level2_keys;
        switch (const auto type = instr.payload().type; type) {
            case update_type::root_keys:
                return signatures_valid(instr, k.root_keys.keys, nullptr, k.root_keys.threshold);
            case update_type::level1_keys:
            case update_type::level2_keys:
                return signatures_valid(instr, k.level1_keys.keys, nullptr, k.level1_keys.threshold);
            default: {
                const access_structure *as = nullptr;
                switch (type) {
                    case update_type::protocol: as = &l2.protocol; break;
                    case update_type::election_difficulty: as = &l2.election_difficulty; break;
                    case update_type::euro_per_energy: as = &l2.euro_per_energy; break;
                    case update_type::micro_gtu_per_euro: as = &l2.micro_gtu_per_euro; break;
                    case update_type::foundation_account: as = &l2.foundation_account; break;
                    case update_type::mint_distribution: as = &l2.mint_distribution; break;
                    case update_type::transaction_fee_distribution: as = &l2.transaction_fee_distribution; break;
                    case update_type::gas_rewards: as = &l2.gas_rewards; break;
                    case update_type::baker_stake_threshold: as = &l2.baker_stake_threshold; break;
                    case update_type::add_anonymity_revoker: as = &l2.add_anonymity_revoker; break;
                    case update_type::add_identity_provider: as = &l2.add_identity_provider; break;
                    default: throw error(fmt::format("unsupported update type: {}", static_cast<int>(type)));
                }
                return signatures_valid(instr, l2.keys, &as->keys, as->threshold);
            }
        }
    }

    update_sequence_number updates::next_sequence_number(const update_type type) const
    {
        return visit_queue(pending, type, [](const auto &q) {
            return q.next_sequence_number;
        });
    }

    enqueue_result updates::enqueue_update(const update_instruction &instr)
    {
        const auto &hdr = instr.header();
        const auto &payload = instr.payload();
        if (hdr.seq != next_sequence_number(payload.type))
            return enqueue_result::sequence_number_mismatch;
        if (hdr.timeout > hdr.effective_time)
            return enqueue_result::expired_timeout;
        if (!authorized(instr))
            return enqueue_result::unauthorized;
        visit_queue(pending, payload.type, [&](auto &q) {
            using payload_type = typename std::decay_t<decltype(q)>::value_type;
            q.enqueue(hdr.effective_time, std::get<payload_type>(payload.value));
        });
        logger::debug("updates: enqueued {} update #{} effective at {}", payload.type, hdr.seq, hdr.effective_time);
        return enqueue_result::ok;
    }
}
