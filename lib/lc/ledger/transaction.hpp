/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_TRANSACTION_HPP
#define LEDGER_CORE_LEDGER_TRANSACTION_HPP

#include <compare>
#include <memory>
#include <lc/codec/binary.hpp>
#include <lc/ed25519.hpp>
#include <lc/json.hpp>
#include <lc/ledger/types.hpp>

namespace ledger_core::ledger {
    struct transaction_header {
        static constexpr size_t serialized_size = sizeof(account_address) + sizeof(account_nonce)
            + sizeof(energy_amount) + sizeof(payload_length) + sizeof(transaction_time);

        account_address sender {};
        account_nonce nonce = min_nonce;
        energy_amount energy = 0;
        payload_length payload_size = 0;
        transaction_time expiry = 0;

        static transaction_header from_bytes(codec::decoder &dec);
        void to_bytes(codec::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const transaction_header &o) const =default;
    };

    struct signature_entry {
        key_index index = 0;
        uint8_vector sig {};

        bool operator==(const signature_entry &o) const =default;
    };

    // wire form: [count:u8 1..255] then count * [key index:u8][length:u16][signature bytes]
    struct transaction_signature: vector<signature_entry> {
        using base_type = vector<signature_entry>;
        using base_type::base_type;

        static transaction_signature from_bytes(codec::decoder &dec);
        void to_bytes(codec::encoder &enc) const;
    };

    struct account_keys {
        map<key_index, ed25519::vkey> keys {};
        uint8_t threshold = 1;
    };

    struct transaction {
        static transaction make(transaction_time arrival, transaction_signature sig, const transaction_header &hdr, buffer payload);
        // structural validation only, signatures are not checked
        static transaction from_bytes(codec::decoder &dec, transaction_time arrival);
        static transaction from_bytes(buffer bytes, transaction_time arrival);

        const transaction_signature &signature() const noexcept
        {
            return _signature;
        }

        const transaction_header &header() const noexcept
        {
            return _header;
        }

        buffer payload() const noexcept
        {
            return _payload;
        }

        const tx_hash &hash() const noexcept
        {
            return _hash;
        }

        size_t size() const noexcept
        {
            return _size;
        }

        transaction_time arrival() const noexcept
        {
            return _arrival;
        }

        const account_address &sender() const noexcept
        {
            return _header.sender;
        }

        account_nonce nonce() const noexcept
        {
            return _header.nonce;
        }

        void to_bytes(codec::encoder &enc) const;
        uint8_vector to_bytes() const;
        json::object to_json() const;

        bool operator==(const transaction &o) const noexcept
        {
            return _hash == o._hash;
        }

        std::strong_ordering operator<=>(const transaction &o) const noexcept
        {
            return _hash <=> o._hash;
        }
    private:
        transaction_signature _signature;
        transaction_header _header;
        uint8_vector _payload;
        tx_hash _hash;
        size_t _size;
        transaction_time _arrival;

        transaction(transaction_signature &&sig, const transaction_header &hdr, buffer payload,
            const tx_hash &hash, size_t size, transaction_time arrival);
    };
    using transaction_ptr = std::shared_ptr<const transaction>;

    using signing_key_list = vector<std::pair<key_index, ed25519::skey>>;

    // sets the header's payload size to match the payload and signs the hash of the body with every key
    extern transaction sign_transaction(const signing_key_list &keys, transaction_header hdr, buffer payload, transaction_time arrival);
    extern bool verify_transaction(const account_keys &keys, const transaction &tx);
}

namespace fmt {
    template<>
    struct formatter<ledger_core::ledger::transaction_header>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "sender: {} nonce: {} energy: {} payload size: {} expiry: {}",
                v.sender, v.nonce, v.energy, v.payload_size, v.expiry);
        }
    };

    template<>
    struct formatter<ledger_core::ledger::transaction>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "tx {} ({} bytes, {})", v.hash(), v.size(), v.header());
        }
    };
}

#endif // !LEDGER_CORE_LEDGER_TRANSACTION_HPP
