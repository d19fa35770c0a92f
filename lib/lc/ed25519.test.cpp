/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/crypto/sha2.hpp>
#include <lc/ed25519.hpp>
#include <lc/common/test.hpp>

using namespace ledger_core;

suite ed25519_suite = [] {
    "ed25519"_test = [] {
        "create-sign-verify"_test = [] {
            ed25519::skey sk1 {}, sk2 {};
            ed25519::vkey vk1 {}, vk2 {};
            ed25519::create(sk1, vk1);
            ed25519::create(sk2, vk2);
            expect(sk1 != sk2);
            expect(vk1 != vk2);
            const std::string msg1 { "message1" }, msg2 { "message2" };
            const auto sig11 = ed25519::sign(msg1, sk1);
            const auto sig12 = ed25519::sign(msg2, sk1);
            const auto sig21 = ed25519::sign(msg1, sk2);
            expect(sig11 != sig12);
            expect(sig11 != sig21);
            expect(ed25519::verify(sig11, vk1, msg1));
            expect(!ed25519::verify(sig11, vk2, msg1));
            expect(!ed25519::verify(sig11, vk1, msg2));
            expect(ed25519::verify(sig12, vk1, msg2));
            expect(ed25519::verify(sig21, vk2, msg1));
            expect(!ed25519::verify(sig21, vk1, msg1));
        };
        "extract-vkey"_test = [] {
            ed25519::skey sk {};
            ed25519::vkey vk {};
            ed25519::create(sk, vk);
            expect(ed25519::extract_vk(sk) == vk);
        };
        "create-seed"_test = [] {
            const auto seed1 = crypto::sha2::digest(std::string_view { "1" });
            const auto seed2 = crypto::sha2::digest(std::string_view { "2" });
            const auto [sk1, vk1] = ed25519::create_from_seed(seed1);
            const auto [sk1_again, vk1_again] = ed25519::create_from_seed(seed1);
            const auto [sk2, vk2] = ed25519::create_from_seed(seed2);
            expect(vk1 == vk1_again);
            expect(sk1 == sk1_again);
            expect(vk1 != vk2);
            const auto sig = ed25519::sign(std::string_view { "message" }, sk1);
            expect(ed25519::verify(sig, vk1, std::string_view { "message" }));
            expect(!ed25519::verify(sig, vk2, std::string_view { "message" }));
        };
        "tampered signature"_test = [] {
            const auto [sk, vk] = ed25519::create_from_seed(crypto::sha2::digest(std::string_view { "tamper" }));
            auto sig = ed25519::sign(std::string_view { "message" }, sk);
            sig[5] ^= 0x01;
            expect(!ed25519::verify(sig, vk, std::string_view { "message" }));
        };
    };
};
