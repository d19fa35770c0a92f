/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef LEDGER_CORE_CLI_COMMON_HPP
#define LEDGER_CORE_CLI_COMMON_HPP

#include <lc/cli.hpp>
#include <lc/ledger/updates.hpp>

namespace ledger_core::cli::common {
    // accepts both a serialized updates state and a genesis description
    extern ledger::updates load_updates(const std::string &path);
    extern void print_updates(const ledger::updates &upd);
}

#endif // !LEDGER_CORE_CLI_COMMON_HPP
