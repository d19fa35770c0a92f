/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <lc/cli/common.hpp>

namespace ledger_core::cli::updates_info {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "updates-info";
            cmd.desc = "show the hash, the protocol update status and the queue sizes of an updates or genesis JSON file";
            cmd.args.expect({ "<updates.json>" });
        }

        void run(const arguments &args) const override
        {
            common::print_updates(common::load_updates(args.at(0)));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
