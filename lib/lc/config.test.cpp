/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/config.hpp>
#include <lc/file.hpp>
#include <lc/ledger/settings.hpp>
#include <lc/common/test.hpp>

using namespace ledger_core;

suite config_suite = [] {
    "config"_test = [] {
        "config_json"_test = [] {
            const config_json cfg { json::object { { "transactionKeepAlive", 60 } } };
            test_same(60, cfg.at("transactionKeepAlive").as_int64());
            expect(cfg.find("maxTimeToExpiry") == nullptr);
            expect(throws([&] { cfg.at("missing"); }));
            expect(!cfg.bytes().empty());
        };
        "config_file"_test = [] {
            const file::tmp tmp { "lc-config-test.json" };
            file::write(tmp.path(), std::string_view { R"({ "maxTimeToExpiry": 3600 })" });
            const config_file cfg { tmp.path() };
            test_same(3600, cfg.at("maxTimeToExpiry").as_int64());
            expect(throws([&] { cfg.at("transactionKeepAlive"); }));
        };
        "config_file invalid"_test = [] {
            const file::tmp tmp { "lc-config-invalid.json" };
            file::write(tmp.path(), std::string_view { "[1, 2, 3]" });
            expect(throws([&] { config_file cfg { tmp.path() }; }));
            expect(throws([] { config_file cfg { "/non-existing/lc-config.json" }; }));
        };
        "ledger settings"_test = [] {
            using ledger::settings;
            const auto defaults = settings::from_config(config_json { json::object {} });
            expect(defaults == settings {});
            test_same(600, defaults.transaction_keep_alive);
            test_same(7200, defaults.max_time_to_expiry);
            const auto custom = settings::from_config(config_json { json::object { { "transactionKeepAlive", 30 }, { "maxTimeToExpiry", 90 } } });
            test_same(30, custom.transaction_keep_alive);
            test_same(90, custom.max_time_to_expiry);
            expect(throws([] { settings::from_config(config_json { json::object { { "maxTimeToExpiry", -1 } } }); }));
            const auto round_trip = settings::from_config(config_json { custom.to_json() });
            expect(round_trip == custom);
        };
    };
};
