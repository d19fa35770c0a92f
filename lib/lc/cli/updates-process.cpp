/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cli/common.hpp>

namespace ledger_core::cli::updates_process {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "updates-process";
            cmd.desc = "apply the pending updates due at <timestamp> and print or save the resulting state";
            cmd.args.expect({ "<updates.json>", "<timestamp>", "[<out.json>]" });
        }

        void run(const arguments &args) const override
        {
            auto upd = common::load_updates(args.at(0));
            const ledger::transaction_time ts = std::stoull(args.at(1));
            const auto processed = upd.process_due(ts);
            for (const auto &ar: processed.anonymity_revokers)
                logger::info("anonymity revoker added: {} ({})", ar.identity, ar.desc.name);
            for (const auto &ip: processed.identity_providers)
                logger::info("identity provider added: {} ({})", ip.identity, ip.desc.name);
            if (args.size() > 2) {
                json::save_pretty(args.at(2), upd.to_json());
                common::print_updates(upd);
            } else {
                std::cout << json::serialize_pretty(upd.to_json()) << '\n';
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
