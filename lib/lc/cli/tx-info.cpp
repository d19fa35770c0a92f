/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cli.hpp>
#include <lc/file.hpp>
#include <lc/ledger/transaction.hpp>

namespace ledger_core::cli::tx_info {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "tx-info";
            cmd.desc = "decode a binary transaction and show its hash, size and header";
            cmd.args.expect({ "<tx-file>" });
            cmd.opts.try_emplace("arrival", option_config { "the arrival time to assign to the transaction", "0" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto raw = file::read(args.at(0));
            const auto arrival = std::stoull(opts.at("arrival").value());
            const auto tx = ledger::transaction::from_bytes(raw, arrival);
            std::cout << fmt::format("{}\n", tx);
            std::cout << json::serialize_pretty(tx.to_json()) << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
