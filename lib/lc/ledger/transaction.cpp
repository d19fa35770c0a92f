/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/ledger/transaction.hpp>

namespace ledger_core::ledger {
    transaction_header transaction_header::from_bytes(codec::decoder &dec)
    {
        transaction_header hdr {};
        hdr.sender = dec.array<sizeof(account_address)>();
        hdr.nonce = dec.u64();
        if (hdr.nonce < min_nonce) [[unlikely]]
            throw codec::decode_error(fmt::format("transaction nonce must be at least {}", min_nonce));
        hdr.energy = dec.u64();
        hdr.payload_size = dec.u32();
        hdr.expiry = dec.u64();
        return hdr;
    }

    void transaction_header::to_bytes(codec::encoder &enc) const
    {
        enc.bytes(sender).u64(nonce).u64(energy).u32(payload_size).u64(expiry);
    }

    json::object transaction_header::to_json() const
    {
        return json::object {
            { "sender", to_hex(sender) },
            { "nonce", nonce },
            { "energyAmount", energy },
            { "payloadSize", payload_size },
            { "expiry", expiry }
        };
    }

    transaction_signature transaction_signature::from_bytes(codec::decoder &dec)
    {
        const size_t num_sigs = dec.u8();
        if (num_sigs == 0) [[unlikely]]
            throw codec::decode_error("a transaction needs at least one signature");
        transaction_signature res {};
        res.reserve(num_sigs);
        for (size_t i = 0; i < num_sigs; ++i) {
            const auto idx = dec.u8();
            res.push_back(signature_entry { idx, uint8_vector { dec.short_bytes() } });
        }
        return res;
    }

    void transaction_signature::to_bytes(codec::encoder &enc) const
    {
        if (empty() || size() > std::numeric_limits<uint8_t>::max()) [[unlikely]]
            throw error(fmt::format("a transaction signature must have between 1 and 255 entries but has {}", size()));
        enc.u8(static_cast<uint8_t>(size()));
        for (const auto &e: *this)
            enc.u8(e.index).short_bytes(e.sig);
    }

    transaction::transaction(transaction_signature &&sig, const transaction_header &hdr, const buffer payload,
            const tx_hash &hash, const size_t size, const transaction_time arrival):
        _signature { std::move(sig) }, _header { hdr }, _payload { payload }, _hash { hash }, _size { size }, _arrival { arrival }
    {
    }

    transaction transaction::make(const transaction_time arrival, transaction_signature sig, const transaction_header &hdr, const buffer payload)
    {
        if (hdr.payload_size != payload.size()) [[unlikely]]
            throw error(fmt::format("the header declares a payload of {} bytes but the payload has {}", hdr.payload_size, payload.size()));
        codec::encoder body {};
        hdr.to_bytes(body);
        body.bytes(payload);
        codec::encoder sig_enc {};
        sig.to_bytes(sig_enc);
        return transaction { std::move(sig), hdr, payload, crypto::sha2::digest(body.data()), body.size() + sig_enc.size(), arrival };
    }

    transaction transaction::from_bytes(codec::decoder &dec, const transaction_time arrival)
    {
        const auto start = dec.pos();
        auto sig = transaction_signature::from_bytes(dec);
        const auto body_start = dec.pos();
        const auto hdr = transaction_header::from_bytes(dec);
        const auto payload = dec.bytes(hdr.payload_size);
        // the hash covers exactly the header and payload bytes as they appear on the wire
        const auto hash = crypto::sha2::digest(dec.consumed_since(body_start));
        return transaction { std::move(sig), hdr, payload, hash, dec.pos() - start, arrival };
    }

    transaction transaction::from_bytes(const buffer bytes, const transaction_time arrival)
    {
        codec::decoder dec { bytes };
        auto tx = from_bytes(dec, arrival);
        dec.expect_end("transaction");
        return tx;
    }

    void transaction::to_bytes(codec::encoder &enc) const
    {
        _signature.to_bytes(enc);
        _header.to_bytes(enc);
        enc.bytes(_payload);
    }

    uint8_vector transaction::to_bytes() const
    {
        codec::encoder enc {};
        to_bytes(enc);
        return enc.take();
    }

    json::object transaction::to_json() const
    {
        json::array sigs {};
        for (const auto &e: _signature) {
            sigs.emplace_back(json::object {
                { "index", e.index },
                { "signature", to_hex(e.sig) }
            });
        }
        return json::object {
            { "hash", to_hex(_hash) },
            { "size", _size },
            { "arrivalTime", _arrival },
            { "header", _header.to_json() },
            { "signatures", std::move(sigs) },
            { "payload", to_hex(_payload) }
        };
    }

    transaction sign_transaction(const signing_key_list &keys, transaction_header hdr, const buffer payload, const transaction_time arrival)
    {
        hdr.payload_size = static_cast<payload_length>(payload.size());
        codec::encoder body {};
        hdr.to_bytes(body);
        body.bytes(payload);
        const auto body_hash = crypto::sha2::digest(body.data());
        transaction_signature sig {};
        for (const auto &[idx, sk]: keys)
            sig.push_back(signature_entry { idx, uint8_vector { ed25519::sign(body_hash, sk) } });
        return transaction::make(arrival, std::move(sig), hdr, payload);
    }

    bool verify_transaction(const account_keys &keys, const transaction &tx)
    {
        const auto &sigs = tx.signature();
        if (sigs.size() > std::numeric_limits<uint8_t>::max() || sigs.size() < keys.threshold)
            return false;
        set<key_index> seen {};
        for (const auto &[idx, sig]: sigs) {
            if (!seen.emplace(idx).second)
                return false;
            const auto key_it = keys.keys.find(idx);
            if (key_it == keys.keys.end())
                return false;
            if (sig.size() != sizeof(ed25519::signature))
                return false;
            if (!ed25519::verify(sig, key_it->second, tx.hash()))
                return false;
        }
        return true;
    }
}
