/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdio>
#include <memory>
#include <lc/file.hpp>

namespace ledger_core::file {
    struct file_closer {
        void operator()(std::FILE *f) const
        {
            std::fclose(f);
        }
    };
    using file_ptr = std::unique_ptr<std::FILE, file_closer>;

    void read(const std::string &path, uint8_vector &buf)
    {
        file_ptr f { std::fopen(path.c_str(), "rb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open for reading: {}", path));
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("failed to determine the size of {}: {}", path, ec.message()));
        buf.resize(sz);
        if (sz > 0 && std::fread(buf.data(), 1, sz, f.get()) != sz) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
    }

    void write(const std::string &path, const buffer &buf)
    {
        const std::filesystem::path p { path };
        if (p.has_parent_path())
            std::filesystem::create_directories(p.parent_path());
        file_ptr f { std::fopen(path.c_str(), "wb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open for writing: {}", path));
        if (!buf.empty() && std::fwrite(buf.data(), 1, buf.size(), f.get()) != buf.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", buf.size(), path));
    }
}
