/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/update-instruction.hpp>

namespace ledger_core::ledger {
    namespace {
        template<typename T>
        bool holds(const update_payload_value::value_type &v)
        {
            return std::holds_alternative<T>(v);
        }

        bool matches(const update_type type, const update_payload_value::value_type &v)
        {
            switch (type) {
                case update_type::protocol: return holds<protocol_update>(v);
                case update_type::election_difficulty: return holds<election_difficulty>(v);
                case update_type::euro_per_energy:
                case update_type::micro_gtu_per_euro:
                    return holds<exchange_rate>(v);
                case update_type::foundation_account: return holds<foundation_account>(v);
                case update_type::mint_distribution: return holds<mint_distribution>(v);
                case update_type::transaction_fee_distribution: return holds<transaction_fee_distribution>(v);
                case update_type::gas_rewards: return holds<gas_rewards>(v);
                case update_type::baker_stake_threshold: return holds<baker_stake_threshold>(v);
                case update_type::root_keys:
                case update_type::level1_keys:
                    return holds<higher_level_keys>(v);
                case update_type::add_anonymity_revoker: return holds<ar_info>(v);
                case update_type::add_identity_provider: return holds<ip_info>(v);
                case update_type::level2_keys: return holds<authorizations>(v);
                default: return false;
            }
        }
    }

    update_payload_value::update_payload_value(const update_type type_, value_type value_):
        type { type_ }, value { std::move(value_) }
    {
        if (!matches(type, value)) [[unlikely]]
            throw error(fmt::format("update payload alternative #{} does not correspond to the update type {}", value.index(), type));
    }

    update_payload_value update_payload_value::from_bytes(codec::decoder &dec)
    {
        const auto type = static_cast<update_type>(dec.u8());
        switch (type) {
            case update_type::protocol: return { type, protocol_update::from_bytes(dec) };
            case update_type::election_difficulty: return { type, election_difficulty::from_bytes(dec) };
            case update_type::euro_per_energy:
            case update_type::micro_gtu_per_euro:
                return { type, exchange_rate::from_bytes(dec) };
            case update_type::foundation_account: return { type, foundation_account::from_bytes(dec) };
            case update_type::mint_distribution: return { type, mint_distribution::from_bytes(dec) };
            case update_type::transaction_fee_distribution: return { type, transaction_fee_distribution::from_bytes(dec) };
            case update_type::gas_rewards: return { type, gas_rewards::from_bytes(dec) };
            case update_type::baker_stake_threshold: return { type, baker_stake_threshold::from_bytes(dec) };
            case update_type::root_keys:
            case update_type::level1_keys:
                return { type, higher_level_keys::from_bytes(dec) };
            case update_type::add_anonymity_revoker: return { type, ar_info::from_bytes(dec) };
            case update_type::add_identity_provider: return { type, ip_info::from_bytes(dec) };
            case update_type::level2_keys: return { type, authorizations::from_bytes(dec) };
            default:
                throw codec::decode_error(fmt::format("unsupported update type: {}", static_cast<int>(type)));
        }
    }

    void update_payload_value::to_bytes(codec::encoder &enc) const
    {
        enc.u8(static_cast<uint8_t>(type));
        std::visit([&](const auto &v) { v.to_bytes(enc); }, value);
    }

    json::object update_payload_value::to_json() const
    {
        return json::object {
            { "updateType", fmt::format("{}", type) },
            { "update", std::visit([](const auto &v) { return json::value(v.to_json()); }, value) }
        };
    }

    update_header update_header::from_bytes(codec::decoder &dec)
    {
        update_header hdr {};
        hdr.seq = dec.u64();
        hdr.effective_time = dec.u64();
        hdr.timeout = dec.u64();
        hdr.payload_size = dec.u32();
        return hdr;
    }

    void update_header::to_bytes(codec::encoder &enc) const
    {
        enc.u64(seq).u64(effective_time).u64(timeout).u32(payload_size);
    }

    json::object update_header::to_json() const
    {
        return json::object {
            { "sequenceNumber", seq },
            { "effectiveTime", effective_time },
            { "timeout", timeout },
            { "payloadSize", payload_size }
        };
    }

    update_instruction::update_instruction(const update_header &hdr, update_payload_value payload, update_signature_list sigs):
        _header { hdr }, _payload { std::move(payload) }, _signatures { std::move(sigs) }
    {
        codec::encoder body {};
        _payload.to_bytes(body);
        if (body.size() != _header.payload_size) [[unlikely]]
            throw error(fmt::format("the update header declares a payload of {} bytes but the payload has {}", _header.payload_size, body.size()));
        codec::encoder msg {};
        _header.to_bytes(msg);
        msg.bytes(body.data());
        _hash = crypto::sha2::digest(msg.data());
    }

    update_instruction update_instruction::from_bytes(codec::decoder &dec)
    {
        const auto hdr = update_header::from_bytes(dec);
        const auto payload_bytes = dec.bytes(hdr.payload_size);
        codec::decoder payload_dec { payload_bytes };
        auto payload = update_payload_value::from_bytes(payload_dec);
        payload_dec.expect_end("update payload");
        update_signature_list sigs {};
        const auto num_sigs = dec.u16();
        sigs.reserve(num_sigs);
        for (size_t i = 0; i < num_sigs; ++i) {
            update_signature_entry e {};
            e.index = dec.u16();
            e.sig = uint8_vector { dec.short_bytes() };
            sigs.emplace_back(std::move(e));
        }
        return update_instruction { hdr, std::move(payload), std::move(sigs) };
    }

    update_instruction update_instruction::from_bytes(const buffer bytes)
    {
        codec::decoder dec { bytes };
        auto instr = from_bytes(dec);
        dec.expect_end("update instruction");
        return instr;
    }

    void update_instruction::to_bytes(codec::encoder &enc) const
    {
        _header.to_bytes(enc);
        _payload.to_bytes(enc);
        if (_signatures.size() > std::numeric_limits<uint16_t>::max()) [[unlikely]]
            throw error(fmt::format("an update instruction cannot have more than 65535 signatures but has {}", _signatures.size()));
        enc.u16(static_cast<uint16_t>(_signatures.size()));
        for (const auto &e: _signatures)
            enc.u16(e.index).short_bytes(e.sig);
    }

    uint8_vector update_instruction::to_bytes() const
    {
        codec::encoder enc {};
        to_bytes(enc);
        return enc.take();
    }

    json::object update_instruction::to_json() const
    {
        json::array sigs {};
        for (const auto &e: _signatures) {
            sigs.emplace_back(json::object {
                { "index", e.index },
                { "signature", to_hex(e.sig) }
            });
        }
        return json::object {
            { "hash", to_hex(_hash) },
            { "header", _header.to_json() },
            { "payload", _payload.to_json() },
            { "signatures", std::move(sigs) }
        };
    }

    update_instruction sign_update_instruction(const update_signing_key_list &keys, const update_sequence_number seq,
        const transaction_time effective_time, const transaction_time timeout, update_payload_value payload)
    {
        codec::encoder body {};
        payload.to_bytes(body);
        const update_header hdr { seq, effective_time, timeout, static_cast<payload_length>(body.size()) };
        update_instruction unsigned_instr { hdr, std::move(payload), {} };
        update_signature_list sigs {};
        for (const auto &[idx, sk]: keys)
            sigs.push_back(update_signature_entry { idx, uint8_vector { ed25519::sign(unsigned_instr.hash(), sk) } });
        return update_instruction { hdr, unsigned_instr.payload(), std::move(sigs) };
    }
}
