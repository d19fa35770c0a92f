/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_TYPES_HPP
#define LEDGER_CORE_LEDGER_TYPES_HPP

#include <cstdint>
#include <lc/array.hpp>
#include <lc/container.hpp>
#include <lc/crypto/sha2.hpp>
#include <lc/logger.hpp>

namespace ledger_core::ledger {
    // A broken internal invariant: the caller has fed the ledger inputs that contradict its state.
    // The operation that detects it is aborted without any changes.
    struct consistency_error: error {
        explicit consistency_error(const std::string_view msg): error { msg }
        {
            logger::error("ledger consistency fault: {}", msg);
        }
    };

    using account_address = byte_array<32>;
    using block_hash = crypto::sha2::hash_256;
    using tx_hash = crypto::sha2::hash_256;

    using account_nonce = uint64_t;
    using energy_amount = uint64_t;
    using payload_length = uint32_t;
    // seconds since the UNIX epoch
    using transaction_time = uint64_t;
    using slot_no = uint64_t;
    using key_index = uint8_t;
    using transaction_index = uint64_t;
    using update_sequence_number = uint64_t;
    using update_key_index = uint16_t;
    using amount = uint64_t;
    using account_index = uint64_t;

    static constexpr account_nonce min_nonce = 1;
    static constexpr update_sequence_number min_update_sequence_number = 1;
}

#endif // !LEDGER_CORE_LEDGER_TYPES_HPP
