/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <sodium.h>
#include <lc/array.hpp>

namespace ledger_core {
    // signing keys and seeds are wiped through libsodium so the compiler cannot elide the stores
    void secure_clear(const std::span<uint8_t> store)
    {
        sodium_memzero(store.data(), store.size());
    }
}
