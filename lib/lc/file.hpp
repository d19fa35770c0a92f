/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_FILE_HPP
#define LEDGER_CORE_FILE_HPP

#include <filesystem>
#include <string>
#include <lc/common/bytes.hpp>

namespace ledger_core::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern void write(const std::string &path, const buffer &buf);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    // removes the file when it goes out of scope; used for temporary outputs
    struct tmp {
        explicit tmp(const std::string &name):
            _path { (std::filesystem::temp_directory_path() / name).string() }
        {
        }

        ~tmp()
        {
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
        }

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !LEDGER_CORE_FILE_HPP
