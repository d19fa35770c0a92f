/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/crypto/sha2.hpp>
#include <lc/common/test.hpp>

using namespace ledger_core;
using namespace ledger_core::crypto;

suite crypto_sha2_suite = [] {
    "crypto::sha2"_test = [] {
        "empty"_test = [] {
            test_same(sha2::hash_256::from_hex("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"), sha2::digest(buffer {}));
        };
        "abc"_test = [] {
            test_same(sha2::hash_256::from_hex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"), sha2::digest(std::string_view { "abc" }));
        };
        "two blocks"_test = [] {
            test_same(sha2::hash_256::from_hex("248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1"),
                sha2::digest(std::string_view { "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq" }));
        };
    };
};
